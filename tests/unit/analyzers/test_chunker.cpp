//
// Created by gregorian-rayne on 1/9/26.
//

#include "sasa/analyzers/chunker.hpp"

#include <gtest/gtest.h>

namespace sasa::analyzers
{
    namespace {

        ChunkingResult chunk(const std::string& source, const AnalysisOptions& options) {
            auto unit = prepare_source(source, options);
            EXPECT_TRUE(unit.is_ok());
            auto report = Chunker{}.analyze(unit.value(), options);
            EXPECT_TRUE(report.is_ok());
            return report.value().chunking;
        }

        AnalysisOptions budget(const std::size_t tokens, const std::size_t chars_per_token = 1) {
            AnalysisOptions options;
            options.token_budget = tokens;
            options.chars_per_token = chars_per_token;
            options.source_name = "etl";
            return options;
        }

    }  // namespace

    TEST(MacroPlaceholderTest, Format) {
        EXPECT_EQ(macro_placeholder(0, "load", "etl"), "/* MACRO_0_load_etl */");
        EXPECT_EQ(macro_placeholder(12, "RUN_ALL", "job"), "/* MACRO_12_RUN_ALL_job */");
    }

    TEST(ChunkerTest, MacrosAreReplacedByPlaceholders) {
        const auto result = chunk(
            "data a; run;\n"
            "%macro load;\n"
            "  data b; run;\n"
            "%mend load;\n"
            "%load\n",
            budget(4000, 4));

        EXPECT_EQ(result.token_budget, 4000u);

        ASSERT_EQ(result.macros.size(), 1u);
        const auto& macro = result.macros[0];
        EXPECT_EQ(macro.index, 0u);
        EXPECT_EQ(macro.name, "load");
        EXPECT_EQ(macro.placeholder, "/* MACRO_0_load_etl */");
        EXPECT_EQ(macro.text, "%macro load;\n  data b; run;\n%mend load;");
        EXPECT_EQ(macro.span.line_begin, 2u);
        EXPECT_FALSE(macro.exceeds_budget);

        ASSERT_EQ(result.chunks.size(), 1u);
        EXPECT_EQ(result.chunks[0].text, "data a; run;\n/* MACRO_0_load_etl */\n%load");
        EXPECT_FALSE(result.chunks[0].oversized);
    }

    TEST(ChunkerTest, PacksStatementsWithinBudget) {
        const auto result = chunk("data a;\nrun;\ndata bb;\nrun;\n", budget(13));

        ASSERT_EQ(result.chunks.size(), 2u);
        EXPECT_EQ(result.chunks[0].text, "data a;\nrun;");
        EXPECT_EQ(result.chunks[0].estimated_tokens, 12u);
        EXPECT_EQ(result.chunks[1].text, "data bb;\nrun;");
        EXPECT_EQ(result.chunks[1].span.line_begin, 3u);
        EXPECT_EQ(result.chunks[1].span.line_end, 4u);

        for (const auto& c : result.chunks) {
            EXPECT_LE(c.estimated_tokens, result.token_budget);
            EXPECT_FALSE(c.oversized);
        }
    }

    TEST(ChunkerTest, OversizedUnitBecomesItsOwnChunk) {
        const auto result = chunk("data abcdef;\nrun;\n", budget(5));

        ASSERT_EQ(result.chunks.size(), 2u);
        EXPECT_EQ(result.chunks[0].text, "data abcdef;");
        EXPECT_TRUE(result.chunks[0].oversized);
        EXPECT_EQ(result.chunks[0].estimated_tokens, 12u);
        EXPECT_FALSE(result.chunks[1].oversized);
    }

    TEST(ChunkerTest, QueryBlocksAreNeverSplit) {
        const std::string query =
            "proc sql;\n"
            " select * from a;\n"
            " select * from b;\n"
            "quit;";
        const auto result = chunk(query + "\n", budget(5));

        ASSERT_EQ(result.chunks.size(), 1u);
        EXPECT_EQ(result.chunks[0].text, query);
        EXPECT_TRUE(result.chunks[0].oversized);
    }

    TEST(ChunkerTest, LargeMacrosAreFlaggedNotSplit) {
        const auto result = chunk("%macro big;\n data x; set y; run;\n%mend;\n", budget(2));

        ASSERT_EQ(result.macros.size(), 1u);
        EXPECT_TRUE(result.macros[0].exceeds_budget);
        EXPECT_EQ(result.macros[0].text, "%macro big;\n data x; set y; run;\n%mend;");
    }

    TEST(ChunkerTest, OnlyTopLevelMacrosAreLifted) {
        const auto result = chunk(
            "%macro outer;\n"
            "  %macro inner;\n"
            "  %mend;\n"
            "%mend;\n",
            budget(4000, 4));

        ASSERT_EQ(result.macros.size(), 1u);
        EXPECT_EQ(result.macros[0].name, "outer");
        ASSERT_EQ(result.chunks.size(), 1u);
        EXPECT_EQ(result.chunks[0].text, "/* MACRO_0_outer_etl */");
    }

    TEST(ChunkerTest, ZeroBudgetIsRejected) {
        auto unit = prepare_source("data a; run;");
        ASSERT_TRUE(unit.is_ok());

        AnalysisOptions options;
        options.token_budget = 0;
        const auto result = Chunker{}.analyze(unit.value(), options);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    }

}  // namespace sasa::analyzers
