//
// Created by gregorian-rayne on 1/6/26.
//

#include "sasa/lexer/lexer.hpp"

#include <gtest/gtest.h>

namespace sasa::lexer
{
    namespace {

        std::vector<Token> significant(const std::vector<Token>& tokens) {
            std::vector<Token> result;
            for (const auto& token : tokens) {
                if (!token.is_comment()) {
                    result.push_back(token);
                }
            }
            return result;
        }

    }  // namespace

    TEST(LexerTest, SimpleDataStep) {
        const auto result = tokenize("data out; set in; run;");

        ASSERT_EQ(result.tokens.size(), 8u);
        EXPECT_TRUE(result.tokens[0].is_word("data"));
        EXPECT_TRUE(result.tokens[0].statement_start);
        EXPECT_FALSE(result.tokens[1].statement_start);
        EXPECT_TRUE(result.tokens[2].is_punct(';'));
        EXPECT_TRUE(result.tokens[3].is_word("set"));
        EXPECT_TRUE(result.tokens[3].statement_start);
        EXPECT_TRUE(result.anomalies.empty());
    }

    TEST(LexerTest, MacroWords) {
        const auto result = tokenize("%let env = PROD;");

        ASSERT_FALSE(result.tokens.empty());
        EXPECT_EQ(result.tokens[0].kind, TokenKind::MacroWord);
        EXPECT_TRUE(result.tokens[0].is_macro("LET"));
        EXPECT_EQ(result.tokens[0].macro_name(), "let");
    }

    TEST(LexerTest, QualifiedNamesAreSingleWords) {
        const auto result = tokenize("select * from &lib..customers, dwh.orders;");

        std::vector<std::string> words;
        for (const auto& token : result.tokens) {
            if (token.kind == TokenKind::Word) {
                words.push_back(token.text);
            }
        }

        ASSERT_EQ(words.size(), 4u);
        EXPECT_EQ(words[2], "&lib..customers");
        EXPECT_EQ(words[3], "dwh.orders");
    }

    TEST(LexerTest, StringsWithDoubledQuotes) {
        const auto result = tokenize("x = 'it''s';");

        ASSERT_EQ(result.tokens.size(), 4u);
        EXPECT_EQ(result.tokens[2].kind, TokenKind::String);
        EXPECT_EQ(result.tokens[2].text, "'it''s'");
    }

    TEST(LexerTest, CommentForms) {
        const auto result = tokenize("/* block */\n* statement comment;\n%* macro comment;\nrun;");

        ASSERT_EQ(result.tokens.size(), 5u);
        EXPECT_TRUE(result.tokens[0].is_comment());
        EXPECT_TRUE(result.tokens[1].is_comment());
        EXPECT_TRUE(result.tokens[2].is_comment());
        EXPECT_TRUE(result.tokens[3].is_word("run"));
        EXPECT_TRUE(result.tokens[3].statement_start);
        EXPECT_EQ(result.tokens[3].line, 4u);
    }

    TEST(LexerTest, AsteriskInsideStatementIsPunct) {
        const auto tokens = significant(tokenize("select * from t;").tokens);

        ASSERT_EQ(tokens.size(), 5u);
        EXPECT_TRUE(tokens[1].is_punct('*'));
    }

    TEST(LexerTest, UnterminatedCommentIsAnomaly) {
        const auto result = tokenize("data x; /* never closed");

        ASSERT_EQ(result.anomalies.size(), 1u);
        EXPECT_EQ(result.anomalies[0].kind, AnomalyKind::UnterminatedComment);
        EXPECT_TRUE(result.tokens.back().is_comment());
    }

    TEST(LexerTest, UnterminatedStringIsAnomaly) {
        const auto result = tokenize("x = \"open;");

        ASSERT_EQ(result.anomalies.size(), 1u);
        EXPECT_EQ(result.anomalies[0].kind, AnomalyKind::UnterminatedString);
    }

    TEST(LexerTest, MacroCallOnItsOwnLineEndsStatement) {
        const auto tokens = significant(tokenize("%setup\nlibname x oracle;\n%load(a, (b))\nproc sql;").tokens);

        ASSERT_GE(tokens.size(), 12u);
        EXPECT_TRUE(tokens[1].is_word("libname"));
        EXPECT_TRUE(tokens[1].statement_start);

        const auto proc = std::ranges::find_if(tokens, [](const Token& t) { return t.is_word("proc"); });
        ASSERT_NE(proc, tokens.end());
        EXPECT_TRUE(proc->statement_start);
    }

    TEST(LexerTest, MacroCallArgumentsOnSameLineDoNotStartStatement) {
        const auto tokens = significant(tokenize("%load(a)").tokens);

        ASSERT_EQ(tokens.size(), 4u);
        EXPECT_FALSE(tokens[1].statement_start);
        EXPECT_FALSE(tokens[2].statement_start);
    }

    TEST(LexerTest, LineNumbersAndOffsets) {
        const auto result = tokenize("a;\n\nb;");

        ASSERT_EQ(result.tokens.size(), 4u);
        EXPECT_EQ(result.tokens[2].line, 3u);
        EXPECT_EQ(result.tokens[2].offset, 4u);
        EXPECT_EQ(result.tokens[2].end(), 5u);
    }

    TEST(MacroWordsInStringTest, DoubleQuotedOnly) {
        const std::string source = "x = \"a %f1\n%g_2(1)\"; y = '%h';";
        const auto tokens = tokenize(source).tokens;

        const auto strings = significant(tokens);
        const auto first = std::ranges::find_if(strings, [](const Token& t) { return t.kind == TokenKind::String; });
        ASSERT_NE(first, strings.end());

        const auto words = macro_words_in_string(*first);
        ASSERT_EQ(words.size(), 2u);
        EXPECT_TRUE(words[0].is_macro("f1"));
        EXPECT_EQ(words[0].line, 1u);
        EXPECT_EQ(source.substr(words[0].offset, 3), "%f1");
        EXPECT_TRUE(words[1].is_macro("g_2"));
        EXPECT_EQ(words[1].line, 2u);

        const auto last = std::find_if(std::next(first), strings.end(), [](const Token& t) {
            return t.kind == TokenKind::String;
        });
        ASSERT_NE(last, strings.end());
        EXPECT_TRUE(macro_words_in_string(*last).empty());
    }

}  // namespace sasa::lexer
