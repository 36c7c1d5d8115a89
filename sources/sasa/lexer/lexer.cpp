//
// Created by gregorian-rayne on 1/4/26.
//

#include "sasa/lexer/lexer.hpp"

#include <cctype>

namespace sasa::lexer {

    namespace {

        bool is_name_start(const char c) noexcept {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        bool is_name_char(const char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        bool is_digit(const char c) noexcept {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

    }  // namespace

    Lexer::Lexer(const std::string_view source) noexcept
        : source_(source) {}

    char Lexer::peek(const std::size_t ahead) const noexcept {
        const auto index = pos_ + ahead;
        return index < source_.size() ? source_[index] : '\0';
    }

    void Lexer::advance(std::size_t count) noexcept {
        while (count-- > 0 && pos_ < source_.size()) {
            if (source_[pos_] == '\n') {
                ++line_;
            }
            ++pos_;
        }
    }

    void Lexer::emit(const TokenKind kind, const std::size_t start, const std::size_t start_line) {
        Token token;
        token.kind = kind;
        token.text = std::string(source_.substr(start, pos_ - start));
        token.offset = start;
        token.line = start_line;

        if (kind == TokenKind::Comment) {
            result_.tokens.push_back(std::move(token));
            return;
        }

        // A macro call without a trailing ';' still ends the statement when
        // the next code starts on a new line.
        const bool after_macro_call = macro_boundary_ && start_line > prev_line_;
        token.statement_start = at_statement_start_ || after_macro_call;

        if (kind == TokenKind::MacroWord) {
            macro_boundary_ = true;
            macro_arg_depth_ = 0;
        } else if (macro_boundary_ && macro_arg_depth_ == 0 && token.is_punct('(') && start_line == prev_line_) {
            macro_boundary_ = false;
            macro_arg_depth_ = 1;
        } else if (macro_arg_depth_ > 0) {
            if (token.is_punct('(')) {
                ++macro_arg_depth_;
            } else if (token.is_punct(')') && --macro_arg_depth_ == 0) {
                macro_boundary_ = true;
            }
        } else {
            macro_boundary_ = false;
        }

        at_statement_start_ = token.is_punct(';');
        prev_line_ = token.last_line();
        result_.tokens.push_back(std::move(token));
    }

    void Lexer::lex_block_comment() {
        const auto start = pos_;
        const auto start_line = line_;
        advance(2);

        while (pos_ < source_.size() && !(peek() == '*' && peek(1) == '/')) {
            advance();
        }

        if (pos_ >= source_.size()) {
            Anomaly anomaly;
            anomaly.kind = AnomalyKind::UnterminatedComment;
            anomaly.message = "block comment is not closed before end of input";
            anomaly.subject = "/*";
            anomaly.span = {start, pos_, start_line, line_};
            result_.anomalies.push_back(std::move(anomaly));
        } else {
            advance(2);
        }

        emit(TokenKind::Comment, start, start_line);
    }

    void Lexer::lex_statement_comment(const std::size_t skip) {
        const auto start = pos_;
        const auto start_line = line_;
        advance(skip);

        while (pos_ < source_.size() && peek() != ';') {
            advance();
        }
        advance();

        emit(TokenKind::Comment, start, start_line);
    }

    void Lexer::lex_string() {
        const auto start = pos_;
        const auto start_line = line_;
        const char quote = peek();
        advance();

        bool closed = false;
        while (pos_ < source_.size()) {
            if (peek() == quote) {
                if (peek(1) == quote) {
                    advance(2);
                    continue;
                }
                advance();
                closed = true;
                break;
            }
            advance();
        }

        if (!closed) {
            Anomaly anomaly;
            anomaly.kind = AnomalyKind::UnterminatedString;
            anomaly.message = "quoted string is not closed before end of input";
            anomaly.subject = std::string(1, quote);
            anomaly.span = {start, pos_, start_line, line_};
            result_.anomalies.push_back(std::move(anomaly));
        }

        emit(TokenKind::String, start, start_line);
    }

    void Lexer::lex_word() {
        const auto start = pos_;
        const auto start_line = line_;

        while (pos_ < source_.size()) {
            const char c = peek();
            if (is_name_char(c) || c == '.') {
                advance();
            } else if (c == '&' && (is_name_start(peek(1)) || peek(1) == '&')) {
                advance();
            } else {
                break;
            }
        }

        emit(TokenKind::Word, start, start_line);
    }

    void Lexer::lex_number() {
        const auto start = pos_;
        const auto start_line = line_;

        while (pos_ < source_.size() && (is_name_char(peek()) || peek() == '.')) {
            advance();
        }

        emit(TokenKind::Number, start, start_line);
    }

    LexResult Lexer::tokenize() {
        result_ = {};
        pos_ = 0;
        line_ = 1;
        prev_line_ = 1;
        at_statement_start_ = true;
        macro_boundary_ = false;
        macro_arg_depth_ = 0;

        while (pos_ < source_.size()) {
            const char c = peek();

            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else if (c == '/' && peek(1) == '*') {
                lex_block_comment();
            } else if (c == '*' && at_statement_start_) {
                lex_statement_comment(1);
            } else if (c == '%' && peek(1) == '*') {
                lex_statement_comment(2);
            } else if (c == '\'' || c == '"') {
                lex_string();
            } else if (c == '%' && is_name_start(peek(1))) {
                const auto start = pos_;
                const auto start_line = line_;
                advance();
                while (pos_ < source_.size() && is_name_char(peek())) {
                    advance();
                }
                emit(TokenKind::MacroWord, start, start_line);
            } else if (is_name_start(c) || (c == '&' && (is_name_start(peek(1)) || peek(1) == '&'))) {
                lex_word();
            } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                lex_number();
            } else {
                const auto start = pos_;
                const auto start_line = line_;
                advance();
                emit(TokenKind::Punct, start, start_line);
            }
        }

        return std::move(result_);
    }

    LexResult tokenize(const std::string_view source) {
        Lexer lexer(source);
        return lexer.tokenize();
    }

    std::vector<Token> macro_words_in_string(const Token& token) {
        std::vector<Token> words;
        if (token.kind != TokenKind::String || token.text.empty() || token.text.front() != '"') {
            return words;
        }

        const std::string_view text = token.text;
        std::size_t line = token.line;
        for (std::size_t i = 1; i < text.size(); ++i) {
            if (text[i] == '\n') {
                ++line;
                continue;
            }
            if (text[i] != '%' || i + 1 >= text.size() || !is_name_start(text[i + 1])) {
                continue;
            }

            auto end = i + 1;
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }

            Token word;
            word.kind = TokenKind::MacroWord;
            word.text = std::string(text.substr(i, end - i));
            word.offset = token.offset + i;
            word.line = line;
            words.push_back(std::move(word));
            i = end - 1;
        }
        return words;
    }

}  // namespace sasa::lexer
