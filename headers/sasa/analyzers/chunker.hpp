//
// Created by gregorian-rayne on 1/9/26.
//

#ifndef SASA_CHUNKER_HPP
#define SASA_CHUNKER_HPP

/**
 * @file chunker.hpp
 * @brief Token-budgeted chunks of the main body.
 *
 * Each top-level macro definition is lifted out whole and replaced in the
 * main body by a placeholder comment:
 *
 *     / * MACRO_<index>_<name>_<source> * /
 *
 * (written without the inner spaces). The main body is then cut into units
 * that are never split: a placeholder, a whole proc sql block, or one
 * top-level statement up to and including its ';'. Units are packed greedily
 * into chunks within the token budget; a unit that alone exceeds the budget
 * becomes its own oversized chunk. Macro units are never split either and
 * are only flagged when they exceed the budget.
 */

#include "sasa/analyzers/analyzer.hpp"

namespace sasa::analyzers {

    /**
     * Builds the placeholder comment for a lifted macro.
     */
    [[nodiscard]] std::string macro_placeholder(std::size_t index, std::string_view name,
                                                std::string_view source_name);

    class Chunker : public IAnalyzer {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "chunks";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Splits the main body into token-budgeted chunks with macro placeholders";
        }

        [[nodiscard]] Result<AnalysisReport, Error> analyze(
            const SourceUnit& unit,
            const AnalysisOptions& options
        ) const override;
    };

}  // namespace sasa::analyzers

#endif //SASA_CHUNKER_HPP
