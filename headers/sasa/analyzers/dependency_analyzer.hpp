//
// Created by gregorian-rayne on 1/8/26.
//

#ifndef SASA_DEPENDENCY_ANALYZER_HPP
#define SASA_DEPENDENCY_ANALYZER_HPP

/**
 * @file dependency_analyzer.hpp
 * @brief Macro call graph.
 *
 * Every %name token that is not a macro-language keyword or built-in macro
 * function is an invocation. It yields an edge from the enclosing macro, or
 * from "<main>" for top-level code, to the invoked name. Edges are kept per
 * call site; the summary graph counts them.
 *
 * - internal: the callee is defined in the same source
 * - external: the callee is defined elsewhere (autocall library, %include)
 * - unused: a defined macro never called from another block
 *
 * The conversion order lists defined macros callees-first. With recursion
 * it falls back to definition order and reports the cycles.
 */

#include "sasa/analyzers/analyzer.hpp"

#include <unordered_set>

namespace sasa::analyzers {

    /**
     * Upper-cased names of macro statements and macro functions that are
     * never treated as calls (LET, IF, DO, STR, SYSFUNC, ...).
     */
    [[nodiscard]] const std::unordered_set<std::string>& builtin_macro_names();

    class DependencyAnalyzer : public IAnalyzer {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "dependencies";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Builds the macro call graph and a callee-first conversion order";
        }

        [[nodiscard]] Result<AnalysisReport, Error> analyze(
            const SourceUnit& unit,
            const AnalysisOptions& options
        ) const override;
    };

}  // namespace sasa::analyzers

#endif //SASA_DEPENDENCY_ANALYZER_HPP
