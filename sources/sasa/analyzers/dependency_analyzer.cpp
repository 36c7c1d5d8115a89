//
// Created by gregorian-rayne on 1/8/26.
//

#include "sasa/analyzers/dependency_analyzer.hpp"
#include "sasa/graph/graph.hpp"
#include "sasa/lexer/lexer.hpp"
#include "sasa/utils/string_utils.hpp"

#include <algorithm>
#include <ranges>
#include <unordered_map>

namespace sasa::analyzers {

    const std::unordered_set<std::string>& builtin_macro_names() {
        static const std::unordered_set<std::string> names = {
            // macro statements
            "LET", "PUT", "IF", "THEN", "ELSE", "DO", "END", "TO", "BY", "WHILE", "UNTIL",
            "GLOBAL", "LOCAL", "INCLUDE", "INC", "MACRO", "MEND", "GOTO", "GO", "RETURN",
            "ABORT", "INPUT", "WINDOW", "DISPLAY", "KEYDEF", "COPY", "SYSCALL", "SYSEXEC",
            "SYSLPUT", "SYSRPUT", "SYSMACDELETE", "SYSMSTORECLEAR",
            // macro functions
            "STR", "NRSTR", "QUOTE", "NRQUOTE", "BQUOTE", "NRBQUOTE", "SUPERQ", "UNQUOTE",
            "EVAL", "SYSEVALF", "SYSFUNC", "QSYSFUNC", "SCAN", "QSCAN", "SUBSTR", "QSUBSTR",
            "UPCASE", "QUPCASE", "LOWCASE", "QLOWCASE", "LENGTH", "INDEX", "SYMEXIST",
            "SYMGLOBL", "SYMLOCAL", "SYSGET", "SYSPROD", "CMPRES", "QCMPRES", "LEFT",
            "QLEFT", "TRIM", "QTRIM", "VERIFY", "DATATYP", "COMPSTOR"
        };
        return names;
    }

    namespace {

        using lexer::Token;
        using lexer::TokenKind;

        std::string include_target(const SourceUnit& unit, const std::size_t index) {
            auto next = index + 1;
            while (next < unit.tokens.size() && unit.tokens[next].is_comment()) {
                ++next;
            }
            if (next >= unit.tokens.size()) {
                return {};
            }
            const auto& target = unit.tokens[next];
            if (target.kind == TokenKind::String) {
                return unit.resolver.substitute(string_utils::unquote(target.text), target.offset);
            }
            if (target.kind == TokenKind::Word) {
                return unit.resolver.substitute(target.text, target.offset);
            }
            return {};
        }

        std::size_t next_code(const std::vector<Token>& tokens, std::size_t index) {
            while (index < tokens.size() && tokens[index].is_comment()) {
                ++index;
            }
            return index;
        }

        bool is_dataset_name(const Token& token) {
            return token.kind == TokenKind::Word &&
                   !token.is_word("_null_") && !token.is_word("_data_") && !token.is_word("_last_");
        }

        /**
         * Token indices of the dataset names listed after the keyword at
         * @p index, up to ';' or a top-level '/'. Parenthesized dataset
         * options and "name=value" statement options are skipped.
         */
        std::vector<std::size_t> dataset_list(const std::vector<Token>& tokens, const std::size_t index) {
            std::vector<std::size_t> names;
            int depth = 0;
            bool option_value = false;
            for (auto k = next_code(tokens, index + 1); k < tokens.size(); k = next_code(tokens, k + 1)) {
                const auto& token = tokens[k];
                if (token.is_punct(';') || (depth == 0 && token.is_punct('/'))) {
                    break;
                }
                if (token.is_punct('(')) {
                    ++depth;
                    option_value = false;
                    continue;
                }
                if (token.is_punct(')')) {
                    depth = std::max(depth - 1, 0);
                    continue;
                }
                if (depth > 0) {
                    continue;
                }
                if (token.is_punct('=')) {
                    option_value = true;
                    continue;
                }
                if (!option_value && is_dataset_name(token)) {
                    const auto next = next_code(tokens, k + 1);
                    if (next >= tokens.size() || !tokens[next].is_punct('=')) {
                        names.push_back(k);
                    }
                }
                option_value = false;
            }
            return names;
        }

        class DatasetCollector {
        public:
            explicit DatasetCollector(const SourceUnit& unit) : unit_(unit) {}

            std::vector<DatasetUsage> collect() {
                const auto& tokens = unit_.tokens;

                // proc sql tables are reported by the table extractor.
                std::vector<bool> in_query(tokens.size(), false);
                for (const auto index : unit_.segmentation.indices_of(SegmentKind::Query)) {
                    const auto& segment = unit_.segmentation.segments[index];
                    for (auto k = segment.first_token; k < segment.end_token && k < tokens.size(); ++k) {
                        in_query[k] = true;
                    }
                }

                for (std::size_t i = 0; i < tokens.size(); ++i) {
                    const auto& token = tokens[i];
                    if (token.kind != TokenKind::Word || in_query[i]) {
                        continue;
                    }

                    const auto next = next_code(tokens, i + 1);
                    const bool option = next < tokens.size() && tokens[next].is_punct('=');

                    if (option && !token.statement_start) {
                        const auto value = next_code(tokens, next + 1);
                        if (value >= tokens.size() || !is_dataset_name(tokens[value])) {
                            continue;
                        }
                        if (token.is_word("out")) {
                            add(i, tokens[value], Direction::Output);
                        } else if (token.is_word("data")) {
                            add(i, tokens[value], Direction::Input);
                        }
                    } else if (option) {
                        continue;
                    } else if (token.statement_start && token.is_word("data")) {
                        for (const auto k : dataset_list(tokens, i)) {
                            add(i, tokens[k], Direction::Output);
                        }
                    } else if (token.statement_start && (token.is_word("set") || token.is_word("merge"))) {
                        for (const auto k : dataset_list(tokens, i)) {
                            add(i, tokens[k], Direction::Input);
                        }
                    }
                }
                return std::move(usages_);
            }

        private:
            enum class Direction { Input, Output };

            void add(const std::size_t index, const Token& name, const Direction direction) {
                const auto block = unit_.segmentation.block_of(index);
                auto [it, inserted] = blocks_.try_emplace(block, usages_.size());
                if (inserted) {
                    usages_.push_back(DatasetUsage{block, {}, {}});
                }

                auto dataset = unit_.resolver.substitute(name.text, name.offset);
                auto& usage = usages_[it->second];
                auto& list = direction == Direction::Input ? usage.inputs : usage.outputs;
                const bool listed = std::ranges::any_of(list, [&](const std::string& existing) {
                    return string_utils::iequals(existing, dataset);
                });
                if (!listed) {
                    list.push_back(std::move(dataset));
                }
            }

            const SourceUnit& unit_;
            std::unordered_map<std::string, std::size_t> blocks_;
            std::vector<DatasetUsage> usages_;
        };

    }  // namespace

    Result<AnalysisReport, Error> DependencyAnalyzer::analyze(
        const SourceUnit& unit,
        const AnalysisOptions& options
    ) const {
        AnalysisReport report;
        auto& result = report.dependencies;
        const auto& segmentation = unit.segmentation;

        std::unordered_set<std::string> builtin = builtin_macro_names();
        for (const auto& extra : options.extra_builtin_macros) {
            builtin.insert(string_utils::to_upper(extra));
        }

        // Canonical spelling per upper-cased name: the definition's, or the
        // first call's for external macros.
        std::unordered_map<std::string, std::string> spelling;
        std::unordered_map<std::string, std::vector<std::size_t>> macro_infos;
        graph::DirectedGraph call_graph;

        for (const auto index : segmentation.indices_of(SegmentKind::Macro)) {
            const auto& segment = segmentation.segments[index];

            MacroInfo info;
            info.name = segment.name;
            info.parameters = segment.parameters;
            info.span = segment.span;
            info.terminated = segment.terminated;
            if (segment.parent) {
                info.parent = segmentation.segments[*segment.parent].name;
            }

            auto key = string_utils::to_upper(segment.name);
            spelling.try_emplace(key, segment.name);
            macro_infos[key].push_back(result.macros.size());
            result.macros.push_back(std::move(info));
            call_graph.add_node(key);
        }

        std::unordered_set<std::string> seen_external;

        const auto record_call = [&](const Token& word, const std::size_t index) {
            auto callee_key = string_utils::to_upper(word.macro_name());
            if (builtin.contains(callee_key)) {
                return;
            }

            const auto caller = segmentation.block_of(index);
            const auto caller_key = string_utils::to_upper(caller);
            const bool internal = macro_infos.contains(callee_key);
            const auto& callee = spelling.try_emplace(callee_key, std::string(word.macro_name())).first->second;

            MacroCall call;
            call.caller = caller;
            call.callee = callee;
            call.internal = internal;
            call.site = {word.offset, word.end(), word.line, word.last_line()};
            result.calls.push_back(std::move(call));

            call_graph.add_edge(caller_key, callee_key);

            if (!internal && seen_external.insert(callee_key).second) {
                result.external_macros.push_back(callee);
            }

            if (const auto it = macro_infos.find(caller_key); it != macro_infos.end()) {
                for (const auto info_index : it->second) {
                    auto& calls = result.macros[info_index].calls;
                    if (std::ranges::find(calls, callee) == calls.end()) {
                        calls.push_back(callee);
                    }
                }
            }

            if (internal && caller_key != callee_key) {
                for (const auto info_index : macro_infos[callee_key]) {
                    result.macros[info_index].invoked = true;
                }
            }
        };

        for (std::size_t i = 0; i < unit.tokens.size(); ++i) {
            const auto& token = unit.tokens[i];
            if (token.kind == TokenKind::String) {
                // "%name" inside double quotes is resolved by SAS.
                for (const auto& word : lexer::macro_words_in_string(token)) {
                    record_call(word, i);
                }
                continue;
            }
            if (token.kind != TokenKind::MacroWord) {
                continue;
            }

            if (token.is_macro("include") || token.is_macro("inc")) {
                if (auto target = include_target(unit, i); !target.empty()) {
                    result.includes.push_back(std::move(target));
                }
                continue;
            }
            record_call(token, i);
        }

        result.datasets = DatasetCollector(unit).collect();

        std::unordered_set<std::string> listed;
        std::vector<std::string> definition_order;
        for (const auto& info : result.macros) {
            auto key = string_utils::to_upper(info.name);
            if (!listed.insert(key).second) {
                continue;
            }
            definition_order.push_back(info.name);
            if (!info.invoked) {
                result.unused_macros.push_back(info.name);
            }
        }

        for (const auto& cycle : graph::detect_cycles(call_graph).cycles) {
            std::vector<std::string> names;
            names.reserve(cycle.nodes.size());
            for (const auto& node : cycle.nodes) {
                const auto it = spelling.find(node);
                names.push_back(it != spelling.end() ? it->second : node);
            }
            result.recursive_cycles.push_back(std::move(names));
        }

        if (auto sorted = graph::topological_sort(call_graph); sorted.is_ok()) {
            for (const auto& node : sorted.value() | std::views::reverse) {
                if (macro_infos.contains(node)) {
                    result.conversion_order.push_back(spelling.at(node));
                }
            }
        } else {
            result.conversion_order = std::move(definition_order);
        }

        return Result<AnalysisReport, Error>::success(std::move(report));
    }

}  // namespace sasa::analyzers
