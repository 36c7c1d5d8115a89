//
// Created by gregorian-rayne on 1/8/26.
//

#ifndef SASA_COMPLEXITY_ANALYZER_HPP
#define SASA_COMPLEXITY_ANALYZER_HPP

/**
 * @file complexity_analyzer.hpp
 * @brief Per-block code metrics.
 *
 * Blocks are each macro body, excluding nested definitions, plus the
 * top-level "<main>" block. Cyclomatic complexity is approximated from
 * keyword counts: conditionals (if, %if) and loops (do/%do with while,
 * until, over or an iteration clause), plus one. Plain `do;` groups are
 * not decisions.
 *
 * A line is code if the block has a non-comment token on it, comment if it
 * has only comment tokens, and blank lines belong to the innermost macro
 * spanning them.
 */

#include "sasa/analyzers/analyzer.hpp"

namespace sasa::analyzers {

    inline constexpr std::string_view kComplexityMethod = "keyword-count approximation";

    class ComplexityAnalyzer : public IAnalyzer {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "complexity";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Computes line counts and approximate cyclomatic complexity per block";
        }

        [[nodiscard]] Result<AnalysisReport, Error> analyze(
            const SourceUnit& unit,
            const AnalysisOptions& options
        ) const override;
    };

}  // namespace sasa::analyzers

#endif //SASA_COMPLEXITY_ANALYZER_HPP
