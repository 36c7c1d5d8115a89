//
// Created by gregorian-rayne on 1/8/26.
//

#include "sasa/analyzers/complexity_analyzer.hpp"

#include <algorithm>

namespace sasa::analyzers {

    namespace {

        using lexer::Token;
        using lexer::TokenKind;

        enum class LineState : unsigned char {
            Blank,
            Comment,
            Code
        };

        std::size_t count_lines(const std::string_view text) {
            if (text.empty()) {
                return 0;
            }
            const auto newlines = static_cast<std::size_t>(std::ranges::count(text, '\n'));
            return text.back() == '\n' ? newlines : newlines + 1;
        }

        bool opens_loop(const std::vector<Token>& tokens, const std::size_t index) {
            auto next = index + 1;
            while (next < tokens.size() && tokens[next].is_comment()) {
                ++next;
            }
            if (next >= tokens.size()) {
                return false;
            }

            const auto& token = tokens[next];
            if (token.is_word("while") || token.is_word("until") || token.is_word("over") ||
                token.is_macro("while") || token.is_macro("until")) {
                return true;
            }

            if (token.kind == TokenKind::Word) {
                auto eq = next + 1;
                while (eq < tokens.size() && tokens[eq].is_comment()) {
                    ++eq;
                }
                return eq < tokens.size() && tokens[eq].is_punct('=');
            }
            return false;
        }

        void count_keywords(const std::vector<Token>& tokens, const std::size_t index, ComplexityMetrics& metrics) {
            const auto& token = tokens[index];

            if (token.statement_start && token.is_word("proc")) {
                ++metrics.proc_count;
            } else if (token.statement_start && token.is_word("data")) {
                ++metrics.data_step_count;
            } else if (token.is_word("if") || token.is_macro("if")) {
                ++metrics.if_count;
            } else if ((token.is_word("do") || token.is_macro("do")) && opens_loop(tokens, index)) {
                ++metrics.loop_count;
            }
        }

    }  // namespace

    Result<AnalysisReport, Error> ComplexityAnalyzer::analyze(
        const SourceUnit& unit,
        const AnalysisOptions& /*options*/
    ) const {
        AnalysisReport report;
        auto& result = report.complexity;
        result.method = std::string(kComplexityMethod);

        const auto& segmentation = unit.segmentation;
        const auto& tokens = unit.tokens;
        const auto total_lines = count_lines(unit.text);
        const auto macro_indices = segmentation.indices_of(SegmentKind::Macro);

        // Block slot 0 is <main>; slot k + 1 is macro_indices[k].
        std::vector<std::size_t> slot_of(segmentation.segments.size(), 0);
        std::vector<ComplexityMetrics> blocks(macro_indices.size() + 1);
        blocks[0].block = std::string(kMainBlock);
        blocks[0].span = {0, unit.text.size(), total_lines > 0 ? 1u : 0u, total_lines};
        for (std::size_t k = 0; k < macro_indices.size(); ++k) {
            const auto& segment = segmentation.segments[macro_indices[k]];
            slot_of[macro_indices[k]] = k + 1;
            blocks[k + 1].block = segment.name;
            blocks[k + 1].span = segment.span;
        }

        const auto slot_for_token = [&](const std::size_t token_index) -> std::size_t {
            const auto owner = segmentation.owner[token_index];
            return owner == Segmentation::npos ? 0 : slot_of[owner];
        };

        // Per block, per line (1-based; index 0 unused).
        std::vector<std::vector<LineState>> lines(blocks.size(), std::vector<LineState>(total_lines + 1, LineState::Blank));
        std::vector<LineState> overall_lines(total_lines + 1, LineState::Blank);

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const auto& token = tokens[i];
            const auto slot = slot_for_token(i);
            const auto state = token.is_comment() ? LineState::Comment : LineState::Code;

            for (auto line = token.line; line <= std::min(token.last_line(), total_lines); ++line) {
                lines[slot][line] = std::max(lines[slot][line], state);
                overall_lines[line] = std::max(overall_lines[line], state);
            }

            if (!token.is_comment()) {
                count_keywords(tokens, i, blocks[slot]);
            }
        }

        for (const auto index : macro_indices) {
            const auto& parent = segmentation.segments[index].parent;
            ++blocks[parent ? slot_of[*parent] : 0].macro_count;
        }

        for (std::size_t line = 1; line <= total_lines; ++line) {
            if (overall_lines[line] == LineState::Blank) {
                // Innermost macro spanning the line; later segments nest deeper.
                std::size_t slot = 0;
                for (std::size_t k = 0; k < macro_indices.size(); ++k) {
                    const auto& span = segmentation.segments[macro_indices[k]].span;
                    if (span.line_begin <= line && line <= span.line_end) {
                        slot = k + 1;
                    }
                }
                ++blocks[slot].blank_lines;
                ++result.overall.blank_lines;
                continue;
            }

            for (std::size_t slot = 0; slot < blocks.size(); ++slot) {
                if (lines[slot][line] == LineState::Code) {
                    ++blocks[slot].code_lines;
                } else if (lines[slot][line] == LineState::Comment) {
                    ++blocks[slot].comment_lines;
                }
            }

            if (overall_lines[line] == LineState::Code) {
                ++result.overall.code_lines;
            } else {
                ++result.overall.comment_lines;
            }
        }

        result.overall.block = "<file>";
        result.overall.span = blocks[0].span;
        result.overall.total_lines = total_lines;

        for (auto& block : blocks) {
            block.total_lines = block.code_lines + block.comment_lines + block.blank_lines;
            result.overall.macro_count += block.macro_count;
            result.overall.proc_count += block.proc_count;
            result.overall.data_step_count += block.data_step_count;
            result.overall.if_count += block.if_count;
            result.overall.loop_count += block.loop_count;
        }

        result.blocks = std::move(blocks);
        return Result<AnalysisReport, Error>::success(std::move(report));
    }

}  // namespace sasa::analyzers
