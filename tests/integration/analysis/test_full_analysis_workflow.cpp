//
// Created by gregorian-rayne on 1/13/26.
//

#include "sasa/sasa.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace sasa::test
{
    using analyzers::AnalysisOptions;
    using analyzers::AnalysisReport;
    using analyzers::DatabaseUsage;

    namespace {

        constexpr const char* kRiskLoad =
            "/* Nightly risk mart load */\n"
            "%let mart_lib = DATA_MART;\n"
            "%let env = PROD;\n"
            "\n"
            "libname dwh oracle user=etl path=\"DWH_&env\";\n"
            "libname RSK_CALC teradata server=\"td1\" schema=\"RISK_DB\";\n"
            "libname &mart_lib teradata server=\"td2\";\n"
            "libname stage oracle path=\"S1\";\n"
            "libname stage db2 database=S2;\n"
            "\n"
            "%macro A;\n"
            "  %B\n"
            "  proc sql;\n"
            "    insert into DATA_MART.risk_results\n"
            "    select * from RSK_CALC.exposures;\n"
            "  quit;\n"
            "%mend A;\n"
            "\n"
            "%macro B;\n"
            "  %C(1)\n"
            "  proc sql;\n"
            "    select * from dwh.customers;\n"
            "    update dwh.customers set flag = 1;\n"
            "    delete from stage.tmp_exposures;\n"
            "  quit;\n"
            "%mend B;\n"
            "\n"
            "data _null_;\n"
            "  if \"&env\" = \"PROD\" then put \"production run\";\n"
            "run;\n"
            "\n"
            "%A\n";

        AnalysisOptions risk_options() {
            AnalysisOptions options;
            options.source_name = "risk_load";
            return options;
        }

        const DatabaseUsage* find_database(const AnalysisReport& report, const std::string& name) {
            const auto& databases = report.databases.databases;
            const auto it = std::ranges::find_if(databases, [&](const DatabaseUsage& usage) {
                return usage.handle.database_name == name;
            });
            return it == databases.end() ? nullptr : &*it;
        }

        OperationSet ops(std::initializer_list<TableOperation> list) {
            return OperationSet(list);
        }

    }  // namespace

    class FullAnalysisWorkflowTest : public ::testing::Test {
    protected:
        void SetUp() override {
            auto result = analyzers::analyze(kRiskLoad, risk_options());
            ASSERT_TRUE(result.is_ok()) << result.error().to_string();
            report = std::move(result.value());
        }

        AnalysisReport report;
    };

    TEST_F(FullAnalysisWorkflowTest, DatabasesInDeclarationOrder) {
        const auto& databases = report.databases.databases;

        ASSERT_EQ(databases.size(), 4u);
        EXPECT_EQ(databases[0].handle.database_name, "dwh");
        EXPECT_EQ(databases[1].handle.database_name, "RISK_DB");
        EXPECT_EQ(databases[2].handle.database_name, "DATA_MART");
        EXPECT_EQ(databases[3].handle.database_name, "stage");
        EXPECT_TRUE(report.databases.unattributed.empty());
    }

    TEST_F(FullAnalysisWorkflowTest, SelectAndUpdateAreUnioned) {
        const auto* dwh = find_database(report, "dwh");
        ASSERT_NE(dwh, nullptr);
        EXPECT_EQ(dwh->handle.type, DatabaseType::Oracle);
        ASSERT_EQ(dwh->tables.size(), 1u);
        EXPECT_EQ(dwh->tables[0].table, "customers");
        EXPECT_EQ(dwh->tables[0].operations, ops({TableOperation::Select, TableOperation::Update}));
    }

    TEST_F(FullAnalysisWorkflowTest, TeradataSchemaNamesTheDatabase) {
        const auto* risk = find_database(report, "RISK_DB");
        ASSERT_NE(risk, nullptr);
        EXPECT_EQ(risk->handle.alias, "RSK_CALC");
        EXPECT_EQ(risk->handle.type, DatabaseType::Teradata);

        ASSERT_EQ(risk->tables.size(), 2u);
        EXPECT_EQ(risk->tables[0].table, "RSK_CALC");
        EXPECT_EQ(risk->tables[1].table, "exposures");
    }

    TEST_F(FullAnalysisWorkflowTest, LibraryAliasFromMacroVariable) {
        const auto* mart = find_database(report, "DATA_MART");
        ASSERT_NE(mart, nullptr);
        EXPECT_EQ(mart->handle.alias, "DATA_MART");
        EXPECT_EQ(mart->handle.type, DatabaseType::Teradata);

        ASSERT_EQ(mart->tables.size(), 2u);
        EXPECT_EQ(mart->tables[0].table, "DATA_MART");
        EXPECT_EQ(mart->tables[1].table, "risk_results");
        EXPECT_EQ(mart->tables[1].operations, ops({TableOperation::Insert}));

        EXPECT_EQ(report.variables.at("MART_LIB"), "DATA_MART");
        EXPECT_EQ(report.variables.at("ENV"), "PROD");
    }

    TEST_F(FullAnalysisWorkflowTest, LatestLibraryDeclarationWins) {
        const auto* stage = find_database(report, "stage");
        ASSERT_NE(stage, nullptr);
        EXPECT_EQ(stage->handle.type, DatabaseType::Db2);
        EXPECT_EQ(stage->handle.connection_detail, "database=S2");
        ASSERT_EQ(stage->tables.size(), 1u);
        EXPECT_EQ(stage->tables[0].operations, ops({TableOperation::Delete}));

        ASSERT_EQ(report.anomalies.size(), 1u);
        EXPECT_EQ(report.anomalies[0].kind, AnomalyKind::ConflictingLibraryDialect);
        EXPECT_EQ(report.anomalies[0].span.line_begin, 9u);
    }

    TEST_F(FullAnalysisWorkflowTest, MacroCallGraph) {
        const auto& deps = report.dependencies;

        ASSERT_EQ(deps.macros.size(), 2u);
        ASSERT_EQ(deps.calls.size(), 3u);

        EXPECT_EQ(deps.calls[0].caller, "A");
        EXPECT_EQ(deps.calls[0].callee, "B");
        EXPECT_TRUE(deps.calls[0].internal);

        EXPECT_EQ(deps.calls[1].caller, "B");
        EXPECT_EQ(deps.calls[1].callee, "C");
        EXPECT_FALSE(deps.calls[1].internal);

        EXPECT_EQ(deps.calls[2].caller, "<main>");
        EXPECT_EQ(deps.calls[2].site.line_begin, 32u);

        EXPECT_EQ(deps.external_macros, std::vector<std::string>{"C"});
        EXPECT_TRUE(deps.unused_macros.empty());
        EXPECT_EQ(deps.conversion_order, (std::vector<std::string>{"B", "A"}));
    }

    TEST_F(FullAnalysisWorkflowTest, ComplexityIsDecisionsPlusOne) {
        const auto& complexity = report.complexity;

        ASSERT_EQ(complexity.blocks.size(), 3u);
        for (const auto& block : complexity.blocks) {
            EXPECT_EQ(block.cyclomatic_complexity(), block.decision_points() + 1) << block.block;
            EXPECT_GE(block.cyclomatic_complexity(), 1u) << block.block;
        }

        EXPECT_EQ(complexity.blocks[0].if_count, 1u);
        EXPECT_EQ(complexity.blocks[0].data_step_count, 1u);
        EXPECT_EQ(complexity.blocks[0].macro_count, 2u);
        EXPECT_EQ(complexity.overall.total_lines, 32u);
    }

    TEST_F(FullAnalysisWorkflowTest, MacrosAreLiftedWhole) {
        const auto& chunking = report.chunking;

        ASSERT_EQ(chunking.macros.size(), 2u);
        EXPECT_EQ(chunking.macros[0].placeholder, "/* MACRO_0_A_risk_load */");
        EXPECT_EQ(chunking.macros[1].placeholder, "/* MACRO_1_B_risk_load */");
        EXPECT_EQ(chunking.macros[0].text.rfind("%macro A;", 0), 0u);
        EXPECT_TRUE(chunking.macros[0].text.ends_with("%mend A;"));

        ASSERT_EQ(chunking.chunks.size(), 1u);
        const auto& body = chunking.chunks[0].text;
        EXPECT_EQ(body.find("%macro"), std::string::npos);
        EXPECT_NE(body.find("/* MACRO_0_A_risk_load */"), std::string::npos);
        EXPECT_NE(body.find("/* MACRO_1_B_risk_load */"), std::string::npos);
    }

    TEST(FullAnalysisBudgetTest, SmallBudgetNeverSplitsMacros) {
        auto options = risk_options();
        options.token_budget = 8;

        const auto result = analyzers::analyze(kRiskLoad, options);
        ASSERT_TRUE(result.is_ok());

        const auto& chunking = result.value().chunking;
        ASSERT_EQ(chunking.macros.size(), 2u);
        for (const auto& macro : chunking.macros) {
            EXPECT_TRUE(macro.exceeds_budget);
            EXPECT_TRUE(macro.text.ends_with("%mend " + macro.name + ";"));
        }

        EXPECT_GT(chunking.chunks.size(), 1u);
        for (const auto& chunk : chunking.chunks) {
            EXPECT_TRUE(chunk.oversized || chunk.estimated_tokens <= options.token_budget);
            EXPECT_EQ(chunk.text.find("%macro"), std::string::npos);
        }
    }

    TEST(FullAnalysisDeterminismTest, RepeatedRunsProduceSameDocument) {
        exporters::ExportOptions export_options;
        export_options.include_metadata = false;

        const auto first = analyzers::analyze(kRiskLoad, risk_options());
        const auto second = analyzers::analyze(kRiskLoad, risk_options());
        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(second.is_ok());

        EXPECT_EQ(exporters::to_json(first.value(), export_options),
                  exporters::to_json(second.value(), export_options));
    }

    TEST(FullAnalysisDatabaseOnlyTest, OnlyDatabasesAreProduced) {
        auto options = risk_options();
        options.database_only = true;

        const auto result = analyzers::analyze(kRiskLoad, options);
        ASSERT_TRUE(result.is_ok());

        const auto& report = result.value();
        EXPECT_EQ(report.databases.databases.size(), 4u);
        EXPECT_TRUE(report.dependencies.macros.empty());
        EXPECT_TRUE(report.complexity.method.empty());
        EXPECT_EQ(report.chunking.token_budget, 0u);

        const auto document = exporters::to_json(report);
        EXPECT_EQ(document.size(), 1u);
        EXPECT_TRUE(document.contains("databases"));
    }

    TEST(FullAnalysisInputTest, EmptyInputIsRejected) {
        for (const auto* text : {"", "   \n\t\n"}) {
            const auto result = analyzers::analyze(text);
            ASSERT_TRUE(result.is_err());
            EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
        }
    }

    TEST(FullAnalysisInputTest, MalformedBytesAreRejected) {
        using namespace std::string_literals;
        for (const auto& text : {"data a;\0 run;"s, "data \xff\xfe; run;"s, "title \"caf\xc3\";"s}) {
            const auto result = analyzers::analyze(text);
            ASSERT_TRUE(result.is_err());
            EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
        }

        EXPECT_TRUE(analyzers::analyze("title \"caf\xc3\xa9\";").is_ok());
    }

    TEST(FullAnalysisInputTest, InvalidOptionsAreRejected) {
        AnalysisOptions options;
        options.chars_per_token = 0;

        const auto result = analyzers::analyze("data a; run;", options);
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    }

    TEST(FullAnalysisInputTest, UnterminatedMacroStillAnalyzed) {
        const auto result = analyzers::analyze("%macro broken;\n  data x; run;\n");
        ASSERT_TRUE(result.is_ok());

        const auto& report = result.value();
        ASSERT_EQ(report.dependencies.macros.size(), 1u);
        EXPECT_FALSE(report.dependencies.macros[0].terminated);
        ASSERT_FALSE(report.anomalies.empty());
        EXPECT_EQ(report.anomalies[0].kind, AnomalyKind::UnterminatedMacro);
    }

}  // namespace sasa::test
