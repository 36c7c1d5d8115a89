//
// Created by gregorian-rayne on 1/7/26.
//

#include "sasa/analyzers/table_extractor.hpp"
#include "sasa/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <unordered_set>

namespace sasa::analyzers {

    namespace {

        using lexer::Token;
        using lexer::TokenKind;

        constexpr std::array<std::string_view, 22> kClauseKeywords = {
            "where", "group", "order", "having", "join", "inner", "left", "right",
            "full", "cross", "natural", "on", "union", "except", "intersect",
            "outer", "set", "values", "into", "select", "from", "using"
        };

        bool is_clause_keyword(const Token& token) {
            return std::ranges::any_of(kClauseKeywords, [&](const std::string_view keyword) {
                return token.is_word(keyword);
            });
        }

        /**
         * Accumulates references for one database, keyed by upper-cased
         * table name.
         */
        struct UsageBuilder {
            DatabaseUsage usage;
            std::unordered_map<std::string, std::size_t> index;

            void add(const std::string& table, const TableOperation op, const SourceSpan& span) {
                auto key = string_utils::to_upper(table);
                if (const auto it = index.find(key); it != index.end()) {
                    usage.tables[it->second].operations.insert(op);
                    return;
                }
                TableReference reference;
                reference.alias = usage.handle.alias;
                reference.table = table;
                reference.operations.insert(op);
                reference.first_seen = span;
                index.emplace(std::move(key), usage.tables.size());
                usage.tables.push_back(std::move(reference));
            }
        };

    }  // namespace

    std::optional<QualifiedName> split_qualified_name(const std::string_view resolved) {
        const auto text = string_utils::trim(resolved);
        const auto dot = text.find('.');
        if (dot == std::string_view::npos || dot == 0 || dot + 1 >= text.size()) {
            return std::nullopt;
        }

        QualifiedName name;
        name.alias = std::string(text.substr(0, dot));
        auto table = text.substr(dot + 1);
        // An unresolved "&lib..tbl" keeps the reference terminator.
        if (name.alias.front() == '&' && table.front() == '.') {
            table.remove_prefix(1);
        }
        if (table.empty()) {
            return std::nullopt;
        }
        name.table = std::string(table);
        return name;
    }

    std::vector<std::pair<std::size_t, TableOperation>> scan_sql_statement(
        const std::vector<const Token*>& statement
    ) {
        std::vector<std::pair<std::size_t, TableOperation>> hits;
        const auto m = statement.size();

        const auto word_at = [&](const std::size_t k, const std::string_view word) {
            return k < m && statement[k]->is_word(word);
        };
        const auto name_at = [&](const std::size_t k) {
            return k < m && statement[k]->kind == TokenKind::Word && !is_clause_keyword(*statement[k]);
        };

        const auto parse_source_list = [&](std::size_t p) {
            while (name_at(p)) {
                hits.emplace_back(p, TableOperation::Select);
                ++p;
                if (p < m && statement[p]->is_punct('(')) {
                    int depth = 0;
                    for (; p < m; ++p) {
                        if (statement[p]->is_punct('(')) {
                            ++depth;
                        } else if (statement[p]->is_punct(')') && --depth == 0) {
                            ++p;
                            break;
                        }
                    }
                }
                if (word_at(p, "as")) {
                    p += 2;
                } else if (name_at(p)) {
                    ++p;
                }
                if (p < m && statement[p]->is_punct(',')) {
                    ++p;
                    continue;
                }
                break;
            }
        };

        // True when only macro calls precede position k: "%log_step update t",
        // "%if &x %then update t". A call's parenthesized arguments and a
        // %if condition belong to the prefix.
        const auto after_macro_prefix = [&](const std::size_t k) {
            std::size_t p = 0;
            while (p < k && statement[p]->kind == TokenKind::MacroWord) {
                const bool condition = statement[p]->is_macro("if");
                ++p;
                if (condition) {
                    while (p < k && !statement[p]->is_macro("then")) {
                        ++p;
                    }
                    if (p == k) {
                        return false;
                    }
                } else if (p < k && statement[p]->is_punct('(')) {
                    int depth = 0;
                    for (; p < k; ++p) {
                        if (statement[p]->is_punct('(')) {
                            ++depth;
                        } else if (statement[p]->is_punct(')') && --depth == 0) {
                            ++p;
                            break;
                        }
                    }
                }
            }
            return p == k;
        };

        std::unordered_set<std::size_t> delete_sources;
        bool seen_select = false;

        for (std::size_t k = 0; k < m; ++k) {
            const auto& token = *statement[k];
            if (token.kind != TokenKind::Word) {
                continue;
            }

            if (token.is_word("create")) {
                if (word_at(k + 1, "table") && name_at(k + 2)) {
                    hits.emplace_back(k + 2, TableOperation::CreateTable);
                } else if (word_at(k + 1, "view") && name_at(k + 2)) {
                    hits.emplace_back(k + 2, TableOperation::CreateView);
                }
            } else if (token.is_word("insert")) {
                if (word_at(k + 1, "into") && name_at(k + 2)) {
                    hits.emplace_back(k + 2, TableOperation::Insert);
                }
            } else if (token.is_word("update")) {
                if ((token.statement_start || after_macro_prefix(k)) && name_at(k + 1)) {
                    hits.emplace_back(k + 1, TableOperation::Update);
                }
            } else if (token.is_word("delete")) {
                if (word_at(k + 1, "from") && name_at(k + 2)) {
                    hits.emplace_back(k + 2, TableOperation::Delete);
                    delete_sources.insert(k + 1);
                }
            } else if (token.is_word("select")) {
                seen_select = true;
            } else if (token.is_word("into")) {
                // "into :var" fills macro variables, not a table.
                if (seen_select && !word_at(k - 1, "insert") && name_at(k + 1)) {
                    hits.emplace_back(k + 1, TableOperation::SelectInto);
                }
            } else if (token.is_word("from")) {
                if (!delete_sources.contains(k)) {
                    parse_source_list(k + 1);
                }
            } else if (token.is_word("join")) {
                if (name_at(k + 1)) {
                    hits.emplace_back(k + 1, TableOperation::Select);
                }
            }
        }

        return hits;
    }

    Result<AnalysisReport, Error> TableExtractor::analyze(
        const SourceUnit& unit,
        const AnalysisOptions& options
    ) const {
        AnalysisReport report;

        std::unordered_set<std::string> builtin;
        for (const auto& library : options.builtin_libraries) {
            builtin.insert(string_utils::to_upper(library));
        }

        std::vector<UsageBuilder> usages;
        std::unordered_map<std::string, std::size_t> usage_index;
        for (const auto& handle : unit.libraries.handles()) {
            usage_index.emplace(string_utils::to_upper(handle.alias), usages.size());
            usages.push_back(UsageBuilder{DatabaseUsage{handle, {}}, {}});
        }

        std::unordered_map<std::string, std::size_t> unattributed_index;
        std::unordered_set<std::string> reported_aliases;

        const auto record = [&](const Token& token, const TableOperation op) {
            const auto resolved = unit.resolver.substitute(token.text, token.offset);
            const auto name = split_qualified_name(resolved);
            if (!name) {
                return;
            }

            const auto alias_key = string_utils::to_upper(name->alias);
            if (builtin.contains(alias_key)) {
                return;
            }

            const SourceSpan span{token.offset, token.end(), token.line, token.last_line()};

            if (const auto it = usage_index.find(alias_key); it != usage_index.end()) {
                auto& builder = usages[it->second];
                if (builder.usage.handle.type == DatabaseType::Teradata) {
                    builder.add(builder.usage.handle.alias, op, span);
                }
                builder.add(name->table, op, span);
                return;
            }

            auto key = alias_key + "." + string_utils::to_upper(name->table);
            if (const auto it = unattributed_index.find(key); it != unattributed_index.end()) {
                report.databases.unattributed[it->second].operations.insert(op);
            } else {
                TableReference reference;
                reference.alias = name->alias;
                reference.table = name->table;
                reference.operations.insert(op);
                reference.first_seen = span;
                unattributed_index.emplace(std::move(key), report.databases.unattributed.size());
                report.databases.unattributed.push_back(std::move(reference));
            }

            if (reported_aliases.insert(alias_key).second) {
                Anomaly anomaly;
                anomaly.kind = AnomalyKind::UnattributedTable;
                anomaly.message = "table " + name->alias + "." + name->table +
                                  " references undeclared library " + name->alias;
                anomaly.subject = name->alias;
                anomaly.span = span;
                report.anomalies.push_back(std::move(anomaly));
            }
        };

        for (const auto index : unit.segmentation.indices_of(SegmentKind::Query)) {
            const auto& segment = unit.segmentation.segments[index];

            std::vector<const Token*> statement;
            const auto flush = [&] {
                for (const auto& [position, op] : scan_sql_statement(statement)) {
                    record(*statement[position], op);
                }
                statement.clear();
            };

            for (auto k = segment.first_token; k < segment.end_token; ++k) {
                const auto& token = unit.tokens[k];
                if (token.is_comment()) {
                    continue;
                }
                if (token.is_punct(';')) {
                    flush();
                } else {
                    statement.push_back(&token);
                }
            }
            flush();
        }

        for (auto& builder : usages) {
            if (builder.usage.tables.empty() && !options.include_unused_libraries) {
                continue;
            }
            report.databases.databases.push_back(std::move(builder.usage));
        }

        return Result<AnalysisReport, Error>::success(std::move(report));
    }

}  // namespace sasa::analyzers
