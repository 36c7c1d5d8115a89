//
// Created by gregorian-rayne on 1/6/26.
//

#ifndef SASA_SEGMENTER_HPP
#define SASA_SEGMENTER_HPP

/**
 * @file segmenter.hpp
 * @brief Splits a token stream into macro, query and residual segments.
 *
 * Macro definitions (%macro ... %mend) are matched with a depth stack, so
 * nested definitions are handled. Query blocks (proc sql ... quit;) may sit
 * at top level or inside a macro. Residual segments are the top-level runs
 * of tokens outside both.
 *
 * Faults are recorded, never thrown:
 * - a macro still open at end of input runs to the end (unterminated-macro)
 * - %mend with nothing open (unmatched-macro-end)
 * - %mend naming a different macro closes the innermost one (macro-end-mismatch)
 * - a query block still open at end of input or at the end of its macro
 *   (unterminated-query); a following proc/data step closes it silently
 */

#include "sasa/lexer/token.hpp"
#include "sasa/types.hpp"

#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sasa::analyzers {

    enum class SegmentKind {
        Macro,
        Query,
        Residual
    };

    inline const char* to_string(SegmentKind kind) noexcept {
        switch (kind) {
            case SegmentKind::Macro:    return "macro";
            case SegmentKind::Query:    return "query";
            case SegmentKind::Residual: return "residual";
        }
        return "unknown";
    }

    struct Segment {
        SegmentKind kind = SegmentKind::Residual;
        SourceSpan span;
        SourceSpan body;                ///< Macro body between the header ';' and %mend
        std::size_t first_token = 0;
        std::size_t end_token = 0;      ///< One past the last token
        std::string name;               ///< Macro name
        std::string parameters;         ///< Raw parameter list, parentheses excluded
        std::optional<std::size_t> parent;  ///< Index of the enclosing macro segment
        bool terminated = true;
    };

    struct Segmentation {
        static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

        std::vector<Segment> segments;  ///< Ordered by start offset
        std::vector<std::size_t> owner; ///< Per token: innermost macro segment, or npos
        std::vector<Anomaly> anomalies;

        [[nodiscard]] std::vector<std::size_t> indices_of(SegmentKind kind) const;

        /**
         * Name of the block owning a token: the macro name or "<main>".
         */
        [[nodiscard]] std::string block_of(std::size_t token_index) const;

        /**
         * True for segments not nested inside a macro.
         */
        [[nodiscard]] bool is_top_level(std::size_t segment_index) const;
    };

    class Segmenter {
    public:
        [[nodiscard]] Segmentation segment(std::string_view source,
                                           const std::vector<lexer::Token>& tokens) const;
    };

}  // namespace sasa::analyzers

#endif //SASA_SEGMENTER_HPP
