//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef SASA_TYPES_HPP
#define SASA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures shared by the SAS analyzers.
 *
 * Types are organized into categories:
 *
 * - Basic Types: Duration, Timestamp, SourceSpan
 * - Database Data: DatabaseType, DatabaseHandle, TableOperation, TableReference
 * - Diagnostics: AnomalyKind, Anomaly
 */

#include <string>
#include <string_view>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <chrono>

namespace sasa {

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Half-open byte range [begin, end) into the analysed source, with the
     * 1-based lines of its first and last character.
     */
    struct SourceSpan {
        std::size_t begin = 0;
        std::size_t end = 0;
        std::size_t line_begin = 0;
        std::size_t line_end = 0;

        [[nodiscard]] std::size_t length() const noexcept {
            return end - begin;
        }

        [[nodiscard]] bool contains(const std::size_t offset) const noexcept {
            return offset >= begin && offset < end;
        }
    };

    /**
     * Name of the pseudo block holding all code outside macro definitions.
     */
    inline constexpr std::string_view kMainBlock = "<main>";

    // ============================================================================
    // Database Types
    // ============================================================================

    /**
     * Database dialect selected by a libname engine.
     */
    enum class DatabaseType {
        Generic,
        Base,
        Oracle,
        SqlServer,
        BigQuery,
        Teradata,
        Db2,
        Postgres,
        MySql,
        Snowflake,
        Odbc
    };

    inline const char* to_string(DatabaseType type) noexcept {
        switch (type) {
            case DatabaseType::Generic:   return "generic";
            case DatabaseType::Base:      return "base";
            case DatabaseType::Oracle:    return "oracle";
            case DatabaseType::SqlServer: return "sqlserver";
            case DatabaseType::BigQuery:  return "bigquery";
            case DatabaseType::Teradata:  return "teradata";
            case DatabaseType::Db2:       return "db2";
            case DatabaseType::Postgres:  return "postgres";
            case DatabaseType::MySql:     return "mysql";
            case DatabaseType::Snowflake: return "snowflake";
            case DatabaseType::Odbc:      return "odbc";
        }
        return "generic";
    }

    /**
     * Maps a libname engine token (case-insensitive) to its dialect.
     * Unknown engines map to DatabaseType::Generic.
     */
    [[nodiscard]] DatabaseType database_type_from_engine(std::string_view engine);

    /**
     * Operation performed on a table inside a query block. The declaration
     * order is the order operations are reported in.
     */
    enum class TableOperation {
        Select,
        Insert,
        Update,
        Delete,
        CreateTable,
        CreateView,
        SelectInto
    };

    inline const char* to_string(TableOperation op) noexcept {
        switch (op) {
            case TableOperation::Select:      return "SELECT";
            case TableOperation::Insert:      return "INSERT";
            case TableOperation::Update:      return "UPDATE";
            case TableOperation::Delete:      return "DELETE";
            case TableOperation::CreateTable: return "CREATE TABLE";
            case TableOperation::CreateView:  return "CREATE VIEW";
            case TableOperation::SelectInto:  return "SELECT INTO";
        }
        return "SELECT";
    }

    using OperationSet = std::set<TableOperation>;

    /**
     * A library declared by a libname statement.
     */
    struct DatabaseHandle {
        std::string alias;            ///< Library name as used in source, variables resolved
        std::string database_name;    ///< Alias, or the resolved schema for Teradata
        DatabaseType type = DatabaseType::Generic;
        std::string engine;           ///< Engine token as written
        std::string connection_detail;///< Raw text after the engine, unparsed
        std::optional<std::string> schema;
        std::map<std::string, std::string> attributes;  ///< Lower-cased option names
        SourceSpan declared_at;
    };

    /**
     * One distinct (alias, table) pair seen in query blocks.
     */
    struct TableReference {
        std::string alias;
        std::string table;
        OperationSet operations;
        SourceSpan first_seen;
    };

    // ============================================================================
    // Diagnostics
    // ============================================================================

    enum class AnomalyKind {
        UnterminatedMacro,
        UnterminatedQuery,
        UnmatchedMacroEnd,
        MacroEndMismatch,
        UnterminatedComment,
        UnterminatedString,
        UnattributedTable,
        ConflictingLibraryDialect
    };

    inline const char* to_string(AnomalyKind kind) noexcept {
        switch (kind) {
            case AnomalyKind::UnterminatedMacro:         return "unterminated-macro";
            case AnomalyKind::UnterminatedQuery:         return "unterminated-query";
            case AnomalyKind::UnmatchedMacroEnd:         return "unmatched-macro-end";
            case AnomalyKind::MacroEndMismatch:          return "macro-end-mismatch";
            case AnomalyKind::UnterminatedComment:       return "unterminated-comment";
            case AnomalyKind::UnterminatedString:        return "unterminated-string";
            case AnomalyKind::UnattributedTable:         return "unattributed-table";
            case AnomalyKind::ConflictingLibraryDialect: return "library-dialect-conflict";
        }
        return "unknown";
    }

    /**
     * A structural fault found in otherwise analysable source.
     */
    struct Anomaly {
        AnomalyKind kind = AnomalyKind::UnterminatedMacro;
        std::string message;
        std::string subject;  ///< Macro, alias or token the fault is about
        SourceSpan span;
    };

}  // namespace sasa

#endif //SASA_TYPES_HPP
