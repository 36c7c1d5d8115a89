//
// Created by gregorian-rayne on 1/7/26.
//

#ifndef SASA_TABLE_EXTRACTOR_HPP
#define SASA_TABLE_EXTRACTOR_HPP

/**
 * @file table_extractor.hpp
 * @brief Table operations inside proc sql blocks, grouped by database.
 */

#include "sasa/analyzers/analyzer.hpp"

#include <optional>
#include <utility>

namespace sasa::analyzers {

    /**
     * A qualified table name split into library alias and table.
     */
    struct QualifiedName {
        std::string alias;
        std::string table;
    };

    /**
     * Splits a resolved reference at its first dot. Returns nullopt for
     * one-level names.
     */
    [[nodiscard]] std::optional<QualifiedName> split_qualified_name(std::string_view resolved);

    /**
     * Finds table operations in one SQL statement.
     *
     * @param statement Non-comment tokens of the statement, ';' excluded.
     * @return Pairs of (position in statement, operation) for every table
     *         name; names may be unqualified.
     */
    [[nodiscard]] std::vector<std::pair<std::size_t, TableOperation>> scan_sql_statement(
        const std::vector<const lexer::Token*>& statement
    );

    /**
     * Attributes each qualified table reference in every query block to the
     * library declared for its alias.
     *
     * - A reference is the union of all operations seen for the same
     *   (alias, table) pair, case-insensitively.
     * - Teradata libraries also list their table-family name as a table.
     * - References through undeclared aliases are reported as unattributed,
     *   with one anomaly per alias.
     * - Databases without table operations are omitted unless
     *   include_unused_libraries is set.
     */
    class TableExtractor : public IAnalyzer {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "databases";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Attributes SQL table operations to declared databases";
        }

        [[nodiscard]] Result<AnalysisReport, Error> analyze(
            const SourceUnit& unit,
            const AnalysisOptions& options
        ) const override;
    };

}  // namespace sasa::analyzers

#endif //SASA_TABLE_EXTRACTOR_HPP
