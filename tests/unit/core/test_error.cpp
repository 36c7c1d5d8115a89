//
// Created by gregorian-rayne on 1/6/26.
//

#include "sasa/error.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace sasa
{
    TEST(ErrorTest, MessageWithoutContext) {
        const Error error(ErrorCode::InvalidArgument, "source text is empty");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "source text is empty");
        EXPECT_FALSE(error.has_context());
        EXPECT_EQ(error.to_string(), "[InvalidArgument] source text is empty");
    }

    TEST(ErrorTest, ContextIsShownInBrackets) {
        const auto error = Error::not_found("File not found", "/jobs/load.sas");

        ASSERT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "/jobs/load.sas");
        EXPECT_EQ(error.to_string(), "[NotFound] File not found (context: /jobs/load.sas)");
    }

    TEST(ErrorTest, EachFactorySetsItsCode) {
        const std::pair<Error, ErrorCode> cases[] = {
            {Error::invalid_argument("x"), ErrorCode::InvalidArgument},
            {Error::not_found("x"), ErrorCode::NotFound},
            {Error::parse_error("x"), ErrorCode::ParseError},
            {Error::io_error("x"), ErrorCode::IoError},
            {Error::config_error("x"), ErrorCode::ConfigError},
            {Error::analysis_error("x"), ErrorCode::AnalysisError},
            {Error::internal_error("x"), ErrorCode::InternalError},
        };

        for (const auto& [error, code] : cases) {
            EXPECT_EQ(error.code(), code) << error;
            EXPECT_EQ(error.to_string(), "[" + std::string(error_code_to_string(code)) + "] x");
        }
    }

    TEST(ErrorTest, WithContextChains) {
        const auto parse = Error::parse_error("Failed to parse TOML configuration", "line 3, column 1");
        const auto located = parse.with_context("sasa.toml");

        EXPECT_EQ(located.context().value(), "line 3, column 1; sasa.toml");
        EXPECT_EQ(located.message(), parse.message());
        EXPECT_EQ(Error::io_error("x").with_context("out.json").context().value(), "out.json");
    }

    TEST(ErrorTest, StreamsAsString) {
        std::ostringstream ss;
        ss << Error::config_error("token_budget must be positive") << " / " << ErrorCode::ParseError;
        EXPECT_EQ(ss.str(), "[ConfigError] token_budget must be positive / ParseError");
    }

    TEST(ErrorTest, EqualityIncludesContext) {
        EXPECT_EQ(Error::not_found("missing", "ctx"), Error::not_found("missing", "ctx"));
        EXPECT_NE(Error::not_found("missing", "ctx"), Error::not_found("missing"));
        EXPECT_NE(Error::not_found("missing"), Error::io_error("missing"));
    }

}  // namespace sasa
