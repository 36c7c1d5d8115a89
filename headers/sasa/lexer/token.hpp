//
// Created by gregorian-rayne on 1/4/26.
//

#ifndef SASA_TOKEN_HPP
#define SASA_TOKEN_HPP

/**
 * @file token.hpp
 * @brief Lexical token of SAS source.
 */

#include "sasa/utils/string_utils.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace sasa::lexer {

    enum class TokenKind {
        Word,       ///< Name, keyword or qualified reference (may contain & and .)
        MacroWord,  ///< %name
        Number,
        String,     ///< Quoted literal, quotes included
        Comment,    ///< /* */, * ...; at statement start, %* ...;
        Punct       ///< Any other single character
    };

    inline const char* to_string(TokenKind kind) noexcept {
        switch (kind) {
            case TokenKind::Word:      return "word";
            case TokenKind::MacroWord: return "macro";
            case TokenKind::Number:    return "number";
            case TokenKind::String:    return "string";
            case TokenKind::Comment:   return "comment";
            case TokenKind::Punct:     return "punct";
        }
        return "unknown";
    }

    struct Token {
        TokenKind kind = TokenKind::Punct;
        std::string text;
        std::size_t offset = 0;
        std::size_t line = 1;
        bool statement_start = false;  ///< First non-comment token after ';' or at input start

        [[nodiscard]] std::size_t end() const noexcept {
            return offset + text.size();
        }

        [[nodiscard]] std::size_t last_line() const noexcept {
            return line + static_cast<std::size_t>(std::ranges::count(text, '\n'));
        }

        [[nodiscard]] bool is_comment() const noexcept {
            return kind == TokenKind::Comment;
        }

        [[nodiscard]] bool is_word(const std::string_view word) const noexcept {
            return kind == TokenKind::Word && string_utils::iequals(text, word);
        }

        /**
         * Matches %name against a bare name ("let" matches "%LET").
         */
        [[nodiscard]] bool is_macro(const std::string_view name) const noexcept {
            return kind == TokenKind::MacroWord && string_utils::iequals(macro_name(), name);
        }

        [[nodiscard]] bool is_punct(const char c) const noexcept {
            return kind == TokenKind::Punct && text.size() == 1 && text[0] == c;
        }

        /**
         * Name of a MacroWord without its leading '%'.
         */
        [[nodiscard]] std::string_view macro_name() const noexcept {
            return kind == TokenKind::MacroWord ? std::string_view(text).substr(1) : std::string_view{};
        }
    };

}  // namespace sasa::lexer

#endif //SASA_TOKEN_HPP
