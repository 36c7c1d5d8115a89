//
// Created by gregorian-rayne on 1/5/26.
//

#ifndef SASA_LIBRARY_REGISTRY_HPP
#define SASA_LIBRARY_REGISTRY_HPP

/**
 * @file library_registry.hpp
 * @brief Catalogue of libraries declared by libname statements.
 *
 * Three statement shapes are recognized:
 *
 *     libname dwh oracle user=x path="P";              generic engine
 *     libname RSK_CALC TERADATA server="t1" schema="RISK_DB";
 *     libname raw "/data/raw";                          base library by path
 *
 * For Teradata the alias is a table-family name and the database name comes
 * from schema= (or database=). Aliases are case-insensitive and the latest
 * declaration of an alias wins.
 */

#include "sasa/analyzers/variable_resolver.hpp"
#include "sasa/lexer/token.hpp"
#include "sasa/types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sasa::analyzers {

    class LibraryRegistry {
    public:
        LibraryRegistry() = default;

        /**
         * Scans the token stream for libname statements.
         */
        void collect(std::string_view source,
                     const std::vector<lexer::Token>& tokens,
                     const VariableResolver& resolver);

        /**
         * Adds or replaces a handle. A replacement keeps the position of the
         * first declaration; a change of dialect is recorded as an anomaly.
         */
        void declare(DatabaseHandle handle);

        /**
         * Looks up an alias (case-insensitive).
         */
        [[nodiscard]] const DatabaseHandle* find(std::string_view alias) const;

        /**
         * Handles in order of first declaration.
         */
        [[nodiscard]] const std::vector<DatabaseHandle>& handles() const noexcept {
            return handles_;
        }

        [[nodiscard]] const std::vector<Anomaly>& anomalies() const noexcept {
            return anomalies_;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return handles_.size();
        }

    private:
        std::vector<DatabaseHandle> handles_;
        std::unordered_map<std::string, std::size_t> index_;
        std::vector<Anomaly> anomalies_;
    };

    /**
     * Parses `key=value` options of a libname statement. Keys are
     * lower-cased, values are kept as written (quotes included).
     */
    [[nodiscard]] std::map<std::string, std::string> parse_libname_options(
        std::string_view source,
        const std::vector<lexer::Token>& tokens,
        std::size_t begin,
        std::size_t end
    );

}  // namespace sasa::analyzers

#endif //SASA_LIBRARY_REGISTRY_HPP
