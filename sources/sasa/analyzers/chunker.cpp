//
// Created by gregorian-rayne on 1/9/26.
//

#include "sasa/analyzers/chunker.hpp"

namespace sasa::analyzers {

    namespace {

        struct ChunkUnit {
            SourceSpan span;
            std::string text;
        };

        SourceSpan span_of(const std::vector<lexer::Token>& tokens, const std::size_t first, const std::size_t last) {
            return {tokens[first].offset, tokens[last].end(), tokens[first].line, tokens[last].last_line()};
        }

    }  // namespace

    std::string macro_placeholder(const std::size_t index, const std::string_view name,
                                  const std::string_view source_name) {
        std::string placeholder = "/* MACRO_";
        placeholder += std::to_string(index);
        placeholder += '_';
        placeholder += name;
        placeholder += '_';
        placeholder += source_name;
        placeholder += " */";
        return placeholder;
    }

    Result<AnalysisReport, Error> Chunker::analyze(
        const SourceUnit& unit,
        const AnalysisOptions& options
    ) const {
        if (options.token_budget == 0 || options.chars_per_token == 0) {
            return Result<AnalysisReport, Error>::failure(
                Error::invalid_argument("token budget and chars per token must be positive")
            );
        }

        AnalysisReport report;
        auto& result = report.chunking;
        result.token_budget = options.token_budget;

        const std::string_view source = unit.text;
        const auto& tokens = unit.tokens;
        const auto& segmentation = unit.segmentation;

        std::vector<ChunkUnit> units;
        for (std::size_t index = 0; index < segmentation.segments.size(); ++index) {
            if (!segmentation.is_top_level(index)) {
                continue;
            }
            const auto& segment = segmentation.segments[index];

            switch (segment.kind) {
                case SegmentKind::Macro: {
                    MacroUnit macro;
                    macro.index = result.macros.size();
                    macro.name = segment.name;
                    macro.placeholder = macro_placeholder(macro.index, segment.name, options.source_name);
                    macro.text = std::string(source.substr(segment.span.begin, segment.span.length()));
                    macro.span = segment.span;
                    macro.estimated_tokens = estimate_tokens(macro.text, options.chars_per_token);
                    macro.exceeds_budget = macro.estimated_tokens > options.token_budget;

                    units.push_back({segment.span, macro.placeholder});
                    result.macros.push_back(std::move(macro));
                    break;
                }
                case SegmentKind::Query:
                    units.push_back({segment.span, std::string(source.substr(segment.span.begin, segment.span.length()))});
                    break;
                case SegmentKind::Residual: {
                    auto start = segment.first_token;
                    for (auto k = segment.first_token; k < segment.end_token; ++k) {
                        if (tokens[k].is_punct(';')) {
                            const auto span = span_of(tokens, start, k);
                            units.push_back({span, std::string(source.substr(span.begin, span.length()))});
                            start = k + 1;
                        }
                    }
                    if (start < segment.end_token) {
                        const auto span = span_of(tokens, start, segment.end_token - 1);
                        units.push_back({span, std::string(source.substr(span.begin, span.length()))});
                    }
                    break;
                }
            }
        }

        Chunk current;
        bool open = false;

        const auto flush = [&] {
            if (!open) {
                return;
            }
            current.estimated_tokens = estimate_tokens(current.text, options.chars_per_token);
            current.oversized = current.estimated_tokens > options.token_budget;
            result.chunks.push_back(std::move(current));
            current = Chunk{};
            open = false;
        };

        for (auto& chunk_unit : units) {
            if (open) {
                const auto gap = source.substr(current.span.end, chunk_unit.span.begin - current.span.end);
                const auto combined = current.text.size() + gap.size() + chunk_unit.text.size();
                if ((combined + options.chars_per_token - 1) / options.chars_per_token <= options.token_budget) {
                    current.text += gap;
                    current.text += chunk_unit.text;
                    current.span.end = chunk_unit.span.end;
                    current.span.line_end = chunk_unit.span.line_end;
                    continue;
                }
                flush();
            }

            current.span = chunk_unit.span;
            current.text = std::move(chunk_unit.text);
            open = true;
        }
        flush();

        return Result<AnalysisReport, Error>::success(std::move(report));
    }

}  // namespace sasa::analyzers
