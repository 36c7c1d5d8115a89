//
// Created by gregorian-rayne on 1/6/26.
//

#include "sasa/analyzers/segmenter.hpp"
#include "sasa/utils/string_utils.hpp"

#include <algorithm>
#include <numeric>

namespace sasa::analyzers {

    using lexer::Token;
    using lexer::TokenKind;

    std::vector<std::size_t> Segmentation::indices_of(const SegmentKind kind) const {
        std::vector<std::size_t> result;
        for (std::size_t i = 0; i < segments.size(); ++i) {
            if (segments[i].kind == kind) {
                result.push_back(i);
            }
        }
        return result;
    }

    std::string Segmentation::block_of(const std::size_t token_index) const {
        if (token_index >= owner.size() || owner[token_index] == npos) {
            return std::string(kMainBlock);
        }
        return segments[owner[token_index]].name;
    }

    bool Segmentation::is_top_level(const std::size_t segment_index) const {
        return segment_index < segments.size() && !segments[segment_index].parent.has_value();
    }

    namespace {

        class SegmentBuilder {
        public:
            SegmentBuilder(const std::string_view source, const std::vector<Token>& tokens)
                : source_(source), tokens_(tokens) {
                result_.owner.assign(tokens.size(), Segmentation::npos);
            }

            Segmentation run() {
                std::size_t i = 0;
                while (i < tokens_.size()) {
                    const auto& token = tokens_[i];

                    if (token.is_comment()) {
                        result_.owner[i] = current_owner();
                        ++i;
                    } else if (token.is_macro("macro")) {
                        i = open_macro(i);
                    } else if (token.is_macro("mend")) {
                        i = close_macro(i);
                    } else if (token.statement_start && open_query_ && token.is_word("quit")) {
                        i = finish_query(i);
                    } else {
                        if (token.statement_start && (token.is_word("proc") || token.is_word("data"))) {
                            if (open_query_) {
                                close_query(last_significant_ + 1, false);
                            }
                            if (token.is_word("proc")) {
                                const auto next = next_significant(i + 1);
                                if (next < tokens_.size() && tokens_[next].is_word("sql")) {
                                    open_query(i);
                                }
                            }
                        }
                        mark(i, i);
                        ++i;
                    }
                }

                finish_input();
                add_residuals();
                sort_segments();
                return std::move(result_);
            }

        private:
            [[nodiscard]] std::size_t current_owner() const {
                return macro_stack_.empty() ? Segmentation::npos : macro_stack_.back();
            }

            [[nodiscard]] std::size_t next_significant(std::size_t index) const {
                while (index < tokens_.size() && tokens_[index].is_comment()) {
                    ++index;
                }
                return index;
            }

            [[nodiscard]] std::size_t find_semicolon(std::size_t index) const {
                while (index < tokens_.size() && !tokens_[index].is_punct(';')) {
                    ++index;
                }
                return index;
            }

            [[nodiscard]] SourceSpan span_of(const std::size_t first, const std::size_t end_token) const {
                const auto& head = tokens_[first];
                const auto& tail = tokens_[end_token - 1];
                return {head.offset, tail.end(), head.line, tail.last_line()};
            }

            void mark(const std::size_t first, const std::size_t last) {
                const auto owner = current_owner();
                for (std::size_t k = first; k <= last && k < tokens_.size(); ++k) {
                    result_.owner[k] = owner;
                    if (!tokens_[k].is_comment()) {
                        last_significant_ = k;
                    }
                }
            }

            void record(const AnomalyKind kind, std::string message, std::string subject, const SourceSpan span) {
                Anomaly anomaly;
                anomaly.kind = kind;
                anomaly.message = std::move(message);
                anomaly.subject = std::move(subject);
                anomaly.span = span;
                result_.anomalies.push_back(std::move(anomaly));
            }

            std::size_t open_macro(const std::size_t i) {
                if (open_query_) {
                    close_query(last_significant_ + 1, false);
                }

                Segment segment;
                segment.kind = SegmentKind::Macro;
                segment.first_token = i;
                if (!macro_stack_.empty()) {
                    segment.parent = macro_stack_.back();
                }

                auto cursor = next_significant(i + 1);
                if (cursor < tokens_.size() && tokens_[cursor].kind == TokenKind::Word) {
                    segment.name = tokens_[cursor].text;
                    cursor = next_significant(cursor + 1);
                }

                if (cursor < tokens_.size() && tokens_[cursor].is_punct('(')) {
                    const auto open = cursor;
                    int depth = 0;
                    for (; cursor < tokens_.size(); ++cursor) {
                        if (tokens_[cursor].is_punct('(')) {
                            ++depth;
                        } else if (tokens_[cursor].is_punct(')') && --depth == 0) {
                            break;
                        }
                    }
                    const auto from = tokens_[open].end();
                    const auto to = cursor < tokens_.size() ? tokens_[cursor].offset : source_.size();
                    segment.parameters = std::string(string_utils::trim(source_.substr(from, to - from)));
                }

                auto header_end = find_semicolon(cursor);
                if (header_end >= tokens_.size()) {
                    header_end = tokens_.size() - 1;
                }

                segment.body.begin = tokens_[header_end].end();
                segment.body.line_begin = tokens_[header_end].last_line();

                built_.push_back(std::move(segment));
                macro_stack_.push_back(built_.size() - 1);
                mark(i, header_end);
                return header_end + 1;
            }

            std::size_t close_macro(const std::size_t i) {
                std::string mend_name;
                std::size_t end = i;

                if (const auto next = next_significant(i + 1); next < tokens_.size()) {
                    if (tokens_[next].is_punct(';')) {
                        end = next;
                    } else if (tokens_[next].kind == TokenKind::Word) {
                        // Only "%mend name;" names the macro; a bare %mend may
                        // be followed directly by the next statement.
                        if (const auto semi = next_significant(next + 1);
                            semi < tokens_.size() && tokens_[semi].is_punct(';')) {
                            mend_name = tokens_[next].text;
                            end = semi;
                        }
                    }
                }

                if (macro_stack_.empty()) {
                    record(AnomalyKind::UnmatchedMacroEnd,
                           "%mend without an open %macro",
                           mend_name,
                           span_of(i, end + 1));
                    mark(i, end);
                    return end + 1;
                }

                const auto index = macro_stack_.back();
                if (open_query_ && built_[*open_query_].parent == index) {
                    close_query(last_significant_ + 1, true);
                }

                mark(i, end);

                auto& segment = built_[index];
                if (!mend_name.empty() && !string_utils::iequals(mend_name, segment.name)) {
                    record(AnomalyKind::MacroEndMismatch,
                           "%mend " + mend_name + " closes macro " + segment.name,
                           segment.name,
                           span_of(i, end + 1));
                }

                segment.end_token = end + 1;
                segment.span = span_of(segment.first_token, segment.end_token);
                segment.body.end = std::max(segment.body.begin, tokens_[i].offset);
                segment.body.line_end = tokens_[i].line;

                macro_stack_.pop_back();
                return end + 1;
            }

            void open_query(const std::size_t i) {
                Segment segment;
                segment.kind = SegmentKind::Query;
                segment.first_token = i;
                if (!macro_stack_.empty()) {
                    segment.parent = macro_stack_.back();
                }
                built_.push_back(std::move(segment));
                open_query_ = built_.size() - 1;
            }

            std::size_t finish_query(const std::size_t i) {
                auto end = find_semicolon(i);
                if (end >= tokens_.size()) {
                    end = tokens_.size() - 1;
                }
                mark(i, end);
                close_query(end + 1, false);
                return end + 1;
            }

            void close_query(const std::size_t end_token, const bool unterminated) {
                auto& segment = built_[*open_query_];
                segment.end_token = std::max(end_token, segment.first_token + 1);
                segment.span = span_of(segment.first_token, segment.end_token);
                segment.terminated = !unterminated;

                if (unterminated) {
                    record(AnomalyKind::UnterminatedQuery,
                           "proc sql block is not closed with quit",
                           "proc sql",
                           segment.span);
                }
                open_query_.reset();
            }

            void finish_input() {
                if (open_query_) {
                    close_query(last_significant_ + 1, true);
                }

                while (!macro_stack_.empty()) {
                    auto& segment = built_[macro_stack_.back()];
                    segment.end_token = tokens_.size();
                    segment.span = span_of(segment.first_token, segment.end_token);
                    segment.body.end = std::max(segment.body.begin, tokens_.back().end());
                    segment.body.line_end = tokens_.back().last_line();
                    segment.terminated = false;

                    record(AnomalyKind::UnterminatedMacro,
                           "macro " + segment.name + " has no %mend",
                           segment.name,
                           segment.span);
                    macro_stack_.pop_back();
                }
            }

            void add_residuals() {
                std::vector<bool> covered(tokens_.size(), false);
                for (const auto& segment : built_) {
                    if (segment.parent.has_value()) {
                        continue;
                    }
                    for (auto k = segment.first_token; k < segment.end_token; ++k) {
                        covered[k] = true;
                    }
                }

                std::size_t k = 0;
                while (k < tokens_.size()) {
                    if (covered[k]) {
                        ++k;
                        continue;
                    }
                    const auto first = k;
                    while (k < tokens_.size() && !covered[k]) {
                        ++k;
                    }
                    Segment segment;
                    segment.kind = SegmentKind::Residual;
                    segment.first_token = first;
                    segment.end_token = k;
                    segment.span = span_of(first, k);
                    built_.push_back(std::move(segment));
                }
            }

            void sort_segments() {
                std::vector<std::size_t> order(built_.size());
                std::iota(order.begin(), order.end(), std::size_t{0});
                std::ranges::stable_sort(order, [&](const std::size_t a, const std::size_t b) {
                    return built_[a].span.begin < built_[b].span.begin;
                });

                std::vector<std::size_t> remap(built_.size());
                for (std::size_t pos = 0; pos < order.size(); ++pos) {
                    remap[order[pos]] = pos;
                }

                result_.segments.reserve(built_.size());
                for (const auto index : order) {
                    auto segment = std::move(built_[index]);
                    if (segment.parent) {
                        segment.parent = remap[*segment.parent];
                    }
                    result_.segments.push_back(std::move(segment));
                }

                for (auto& owner : result_.owner) {
                    if (owner != Segmentation::npos) {
                        owner = remap[owner];
                    }
                }
            }

            std::string_view source_;
            const std::vector<Token>& tokens_;
            Segmentation result_;
            std::vector<Segment> built_;
            std::vector<std::size_t> macro_stack_;
            std::optional<std::size_t> open_query_;
            std::size_t last_significant_ = 0;
        };

    }  // namespace

    Segmentation Segmenter::segment(const std::string_view source, const std::vector<Token>& tokens) const {
        if (tokens.empty()) {
            return {};
        }
        SegmentBuilder builder(source, tokens);
        return builder.run();
    }

}  // namespace sasa::analyzers
