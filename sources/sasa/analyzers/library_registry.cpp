//
// Created by gregorian-rayne on 1/5/26.
//

#include "sasa/analyzers/library_registry.hpp"
#include "sasa/utils/string_utils.hpp"

namespace sasa::analyzers {

    namespace {

        using lexer::Token;
        using lexer::TokenKind;

        std::size_t next_significant(const std::vector<Token>& tokens, std::size_t index, const std::size_t end) {
            while (index < end && tokens[index].is_comment()) {
                ++index;
            }
            return index;
        }

        bool starts_option(const std::vector<Token>& tokens, const std::size_t index, const std::size_t end) {
            if (index >= end || tokens[index].kind != TokenKind::Word) {
                return false;
            }
            const auto eq = next_significant(tokens, index + 1, end);
            return eq < end && tokens[eq].is_punct('=');
        }

    }  // namespace

    std::map<std::string, std::string> parse_libname_options(
        const std::string_view source,
        const std::vector<Token>& tokens,
        const std::size_t begin,
        const std::size_t end
    ) {
        std::map<std::string, std::string> options;

        std::size_t i = next_significant(tokens, begin, end);
        while (i < end) {
            if (!starts_option(tokens, i, end)) {
                i = next_significant(tokens, i + 1, end);
                continue;
            }

            const auto key = string_utils::to_lower(tokens[i].text);
            const auto eq = next_significant(tokens, i + 1, end);
            const auto value_begin = next_significant(tokens, eq + 1, end);

            std::size_t value_last = value_begin;
            std::size_t cursor = value_begin;
            int depth = 0;
            while (cursor < end) {
                const auto& token = tokens[cursor];
                if (depth == 0 && cursor != value_begin && starts_option(tokens, cursor, end)) {
                    break;
                }
                if (token.is_punct('(')) {
                    ++depth;
                } else if (token.is_punct(')') && depth > 0) {
                    --depth;
                }
                if (!token.is_comment()) {
                    value_last = cursor;
                }
                ++cursor;
            }

            if (value_begin < end) {
                const auto from = tokens[value_begin].offset;
                const auto to = tokens[value_last].end();
                options[key] = std::string(source.substr(from, to - from));
            } else {
                options[key] = "";
            }

            i = cursor;
        }

        return options;
    }

    void LibraryRegistry::collect(
        const std::string_view source,
        const std::vector<Token>& tokens,
        const VariableResolver& resolver
    ) {
        const auto n = tokens.size();

        for (std::size_t i = 0; i < n; ++i) {
            const auto& keyword = tokens[i];
            if (!keyword.statement_start || !keyword.is_word("libname")) {
                continue;
            }

            std::size_t semi = i + 1;
            while (semi < n && !tokens[semi].is_punct(';')) {
                ++semi;
            }
            const auto statement_end = semi < n ? tokens[semi].end() : source.size();
            const auto detail_end = semi < n ? tokens[semi].offset : source.size();

            const auto alias_index = next_significant(tokens, i + 1, semi);
            const auto engine_index = next_significant(tokens, alias_index + 1, semi);
            if (alias_index >= semi || tokens[alias_index].kind != TokenKind::Word || engine_index >= semi) {
                i = semi;
                continue;
            }

            const auto& engine_token = tokens[engine_index];
            if (engine_token.is_word("clear") || engine_token.is_word("list")) {
                i = semi;
                continue;
            }

            DatabaseHandle handle;
            handle.alias = std::string(string_utils::trim(
                resolver.substitute(tokens[alias_index].text, tokens[alias_index].offset)));
            handle.declared_at = {keyword.offset, statement_end, keyword.line,
                                  semi < n ? tokens[semi].line : keyword.line};

            std::size_t options_begin;
            if (engine_token.kind == TokenKind::Word) {
                handle.engine = engine_token.text;
                handle.type = database_type_from_engine(
                    resolver.substitute(engine_token.text, engine_token.offset));
                handle.connection_detail = std::string(string_utils::trim(
                    source.substr(engine_token.end(), detail_end - engine_token.end())));
                options_begin = engine_index + 1;
            } else if (engine_token.kind == TokenKind::String || engine_token.is_punct('(')) {
                handle.type = DatabaseType::Base;
                handle.connection_detail = std::string(string_utils::trim(
                    source.substr(engine_token.offset, detail_end - engine_token.offset)));
                options_begin = engine_index;
            } else {
                i = semi;
                continue;
            }

            handle.attributes = parse_libname_options(source, tokens, options_begin, semi);
            handle.database_name = handle.alias;

            if (handle.type == DatabaseType::Teradata) {
                auto schema_it = handle.attributes.find("schema");
                if (schema_it == handle.attributes.end()) {
                    schema_it = handle.attributes.find("database");
                }
                if (schema_it != handle.attributes.end()) {
                    const auto resolved = resolver.substitute(schema_it->second, keyword.offset);
                    if (auto schema = std::string(string_utils::unquote(resolved)); !schema.empty()) {
                        handle.database_name = schema;
                        handle.schema = std::move(schema);
                    }
                }
            }

            declare(std::move(handle));
            i = semi;
        }
    }

    void LibraryRegistry::declare(DatabaseHandle handle) {
        auto key = string_utils::to_upper(handle.alias);

        if (const auto it = index_.find(key); it != index_.end()) {
            auto& existing = handles_[it->second];
            if (existing.type != handle.type) {
                Anomaly anomaly;
                anomaly.kind = AnomalyKind::ConflictingLibraryDialect;
                anomaly.message = "library " + handle.alias + " redeclared as " +
                                  to_string(handle.type) + " (previously " + to_string(existing.type) + ")";
                anomaly.subject = handle.alias;
                anomaly.span = handle.declared_at;
                anomalies_.push_back(std::move(anomaly));
            }
            existing = std::move(handle);
            return;
        }

        index_.emplace(std::move(key), handles_.size());
        handles_.push_back(std::move(handle));
    }

    const DatabaseHandle* LibraryRegistry::find(const std::string_view alias) const {
        const auto it = index_.find(string_utils::to_upper(string_utils::trim(alias)));
        if (it == index_.end()) {
            return nullptr;
        }
        return &handles_[it->second];
    }

}  // namespace sasa::analyzers
