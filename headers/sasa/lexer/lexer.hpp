//
// Created by gregorian-rayne on 1/4/26.
//

#ifndef SASA_LEXER_HPP
#define SASA_LEXER_HPP

/**
 * @file lexer.hpp
 * @brief Single-pass SAS tokenizer.
 *
 * The lexer never fails. Unterminated strings and block comments extend to
 * the end of input and are recorded as anomalies. Every token owns a copy of
 * its text, so a token stream outlives the buffer it was produced from.
 *
 * Statement boundaries are tracked so that `* comment;` is recognized only
 * where SAS treats it as a comment statement.
 */

#include "sasa/lexer/token.hpp"
#include "sasa/types.hpp"

#include <string_view>
#include <vector>

namespace sasa::lexer {

    struct LexResult {
        std::vector<Token> tokens;
        std::vector<Anomaly> anomalies;
    };

    class Lexer {
    public:
        explicit Lexer(std::string_view source) noexcept;

        [[nodiscard]] LexResult tokenize();

    private:
        [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept;
        void advance(std::size_t count = 1) noexcept;

        void emit(TokenKind kind, std::size_t start, std::size_t start_line);
        void lex_block_comment();
        void lex_statement_comment(std::size_t skip);
        void lex_string();
        void lex_word();
        void lex_number();

        std::string_view source_;
        std::size_t pos_ = 0;
        std::size_t line_ = 1;
        std::size_t prev_line_ = 1;
        bool at_statement_start_ = true;
        bool macro_boundary_ = false;
        std::size_t macro_arg_depth_ = 0;
        LexResult result_;
    };

    /**
     * Convenience wrapper around Lexer::tokenize().
     */
    [[nodiscard]] LexResult tokenize(std::string_view source);

    /**
     * Macro words inside a double-quoted String token, which SAS resolves
     * at run time. Single-quoted strings and other tokens yield nothing.
     * Offsets and lines refer to the original source.
     */
    [[nodiscard]] std::vector<Token> macro_words_in_string(const Token& token);

}  // namespace sasa::lexer

#endif //SASA_LEXER_HPP
