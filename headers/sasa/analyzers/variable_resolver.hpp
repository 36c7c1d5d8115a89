//
// Created by gregorian-rayne on 1/5/26.
//

#ifndef SASA_VARIABLE_RESOLVER_HPP
#define SASA_VARIABLE_RESOLVER_HPP

/**
 * @file variable_resolver.hpp
 * @brief Macro-variable table built from %let statements.
 *
 * The table is flat: SAS %local/%global scoping is not modelled, and a later
 * definition shadows an earlier one for every reference after it. Values are
 * resolved when they are defined, so `%let x = &x._v2;` extends the previous
 * value of x.
 *
 * Substitution rules:
 * - `&name` and `&name.` are replaced by the latest binding visible at the
 *   reference offset; the terminating dot is consumed.
 * - Undefined names and indirect references (`&&name`) stay verbatim.
 * - A name whose expansion refers back to itself is never expanded.
 * - Substitution is repeated to a fixed point, so it is idempotent.
 */

#include "sasa/lexer/token.hpp"

#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sasa::analyzers {

    struct VariableBinding {
        std::string name;     ///< Upper-cased
        std::string value;    ///< Resolved at definition time
        std::size_t order = 0;
        std::size_t offset = 0;
        bool predefined = false;
    };

    class VariableResolver {
    public:
        static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

        VariableResolver() = default;

        /**
         * Installs a binding visible from the start of the source.
         */
        void predefine(std::string_view name, std::string_view value);

        /**
         * Records a %let binding at the given source offset. The value is
         * resolved against the bindings visible at that offset.
         */
        void define(std::string_view name, std::string_view raw_value, std::size_t offset);

        /**
         * Scans the token stream for `%let name = value;` statements.
         *
         * @param source The buffer the tokens were produced from; values are
         *               taken from it verbatim so spacing is preserved.
         */
        void collect(std::string_view source, const std::vector<lexer::Token>& tokens);

        /**
         * Replaces macro-variable references in text.
         *
         * @param text Text that may contain &name references.
         * @param at Only bindings defined before this offset are visible.
         */
        [[nodiscard]] std::string substitute(std::string_view text, std::size_t at = npos) const;

        /**
         * Returns the binding visible at an offset, if any.
         */
        [[nodiscard]] const VariableBinding* lookup(std::string_view name, std::size_t at = npos) const;

        /**
         * True if expanding the name would eventually reference itself.
         */
        [[nodiscard]] bool is_cyclic(std::string_view name, std::size_t at = npos) const;

        [[nodiscard]] const std::vector<VariableBinding>& bindings() const noexcept {
            return bindings_;
        }

        /**
         * Latest value of every name, for reporting.
         */
        [[nodiscard]] std::map<std::string, std::string> snapshot() const;

    private:
        [[nodiscard]] std::string substitute_once(std::string_view text, std::size_t at,
                                                  std::vector<std::string>& stack) const;

        std::vector<VariableBinding> bindings_;
    };

    /**
     * Extracts the names referenced by &name in text, in order of appearance.
     * Indirect references (&&name) are not included.
     */
    [[nodiscard]] std::vector<std::string> referenced_variables(std::string_view text);

}  // namespace sasa::analyzers

#endif //SASA_VARIABLE_RESOLVER_HPP
