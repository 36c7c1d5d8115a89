//
// Created by gregorian-rayne on 1/8/26.
//

#include "sasa/analyzers/dependency_analyzer.hpp"

#include <gtest/gtest.h>

namespace sasa::analyzers
{
    namespace {

        DependencyAnalysisResult dependencies(const std::string& source, const AnalysisOptions& options = {}) {
            auto unit = prepare_source(source, options);
            EXPECT_TRUE(unit.is_ok());
            auto report = DependencyAnalyzer{}.analyze(unit.value(), options);
            EXPECT_TRUE(report.is_ok());
            return report.value().dependencies;
        }

        using Names = std::vector<std::string>;

    }  // namespace

    TEST(DependencyAnalyzerTest, InternalAndExternalCalls) {
        const auto result = dependencies(
            "%macro A;\n"
            "  %B\n"
            "%mend A;\n"
            "%macro B;\n"
            "  %C(1)\n"
            "%mend B;\n"
            "%A\n");

        ASSERT_EQ(result.macros.size(), 2u);
        EXPECT_EQ(result.macros[0].calls, Names{"B"});
        EXPECT_EQ(result.macros[1].calls, Names{"C"});

        ASSERT_EQ(result.calls.size(), 3u);
        EXPECT_EQ(result.calls[0].caller, "A");
        EXPECT_EQ(result.calls[0].callee, "B");
        EXPECT_TRUE(result.calls[0].internal);
        EXPECT_EQ(result.calls[1].caller, "B");
        EXPECT_EQ(result.calls[1].callee, "C");
        EXPECT_FALSE(result.calls[1].internal);
        EXPECT_EQ(result.calls[2].caller, "<main>");
        EXPECT_EQ(result.calls[2].site.line_begin, 7u);

        EXPECT_EQ(result.external_macros, Names{"C"});
        EXPECT_TRUE(result.unused_macros.empty());
        EXPECT_EQ(result.conversion_order, (Names{"B", "A"}));
        EXPECT_TRUE(result.recursive_cycles.empty());
    }

    TEST(DependencyAnalyzerTest, UnusedMacros) {
        const auto result = dependencies(
            "%macro helper;\n"
            "%mend;\n"
            "%macro main_job;\n"
            "%mend;\n"
            "%main_job\n");

        EXPECT_EQ(result.unused_macros, Names{"helper"});
        EXPECT_TRUE(result.macros[1].invoked);
    }

    TEST(DependencyAnalyzerTest, RecursionFallsBackToDefinitionOrder) {
        const auto result = dependencies(
            "%macro r;\n"
            "  %r\n"
            "%mend r;\n"
            "%macro p;\n"
            "  %q\n"
            "%mend;\n"
            "%macro q;\n"
            "  %p\n"
            "%mend;\n");

        EXPECT_EQ(result.conversion_order, (Names{"r", "p", "q"}));
        ASSERT_EQ(result.recursive_cycles.size(), 2u);
        EXPECT_EQ(result.recursive_cycles[0], (Names{"r", "r"}));
        EXPECT_EQ(result.recursive_cycles[1], (Names{"p", "q", "p"}));

        // A self-call does not count as an invocation.
        EXPECT_EQ(result.unused_macros, Names{"r"});
    }

    TEST(DependencyAnalyzerTest, BuiltinsAreNotCalls) {
        const auto result = dependencies(
            "%let x = 1;\n"
            "%put &x;\n"
            "%include \"/lib/common.sas\";\n"
            "%let d = %sysfunc(today());\n");

        EXPECT_TRUE(result.calls.empty());
        EXPECT_EQ(result.includes, Names{"/lib/common.sas"});
    }

    TEST(DependencyAnalyzerTest, ExtraBuiltinMacros) {
        AnalysisOptions options;
        options.extra_builtin_macros = {"log_msg"};

        const auto result = dependencies("%log_msg(starting)\n%run_job\n", options);

        ASSERT_EQ(result.calls.size(), 1u);
        EXPECT_EQ(result.calls[0].callee, "run_job");
    }

    TEST(DependencyAnalyzerTest, RepeatedCallsKeepFirstSpelling) {
        const auto result = dependencies("%Util_A\n%UTIL_A\n");

        ASSERT_EQ(result.calls.size(), 2u);
        EXPECT_EQ(result.calls[1].callee, "Util_A");
        EXPECT_EQ(result.external_macros, Names{"Util_A"});
        EXPECT_TRUE(result.conversion_order.empty());
    }

    TEST(DependencyAnalyzerTest, NestedDefinitionRecordsParent) {
        const auto result = dependencies(
            "%macro outer;\n"
            "  %macro inner;\n"
            "  %mend inner;\n"
            "  %inner\n"
            "%mend outer;\n");

        ASSERT_EQ(result.macros.size(), 2u);
        ASSERT_TRUE(result.macros[1].parent.has_value());
        EXPECT_EQ(*result.macros[1].parent, "outer");
        EXPECT_EQ(result.macros[0].calls, Names{"inner"});
        EXPECT_TRUE(result.macros[1].invoked);
    }

    TEST(DependencyAnalyzerTest, CallsInsideDoubleQuotes) {
        const auto result = dependencies(
            "%macro hdr;\n"
            "  x\n"
            "%mend hdr;\n"
            "title \"%hdr report %sysfunc(today())\";\n"
            "footnote '%ftr';\n");

        ASSERT_EQ(result.calls.size(), 1u);
        EXPECT_EQ(result.calls[0].caller, "<main>");
        EXPECT_EQ(result.calls[0].callee, "hdr");
        EXPECT_TRUE(result.calls[0].internal);
        EXPECT_EQ(result.calls[0].site.line_begin, 4u);

        EXPECT_TRUE(result.unused_macros.empty());
        EXPECT_TRUE(result.external_macros.empty());
        EXPECT_TRUE(result.macros[0].invoked);
    }

    TEST(DependencyAnalyzerTest, DataStepDatasetUsage) {
        const auto result = dependencies(
            "%let lib = dwh;\n"
            "data work.base(keep=id) stage.flags / view=work.base;\n"
            "  set &lib..customers(where=(active=1)) dwh.extra end=eof;\n"
            "run;\n"
            "%macro sorter;\n"
            "  proc sort data=work.base out=work.sorted; by id; run;\n"
            "  data _null_; merge work.sorted WORK.BASE; by id; run;\n"
            "%mend sorter;\n"
            "proc sql;\n"
            "  create table work.q as select * from dwh.customers where out = flag;\n"
            "quit;\n");

        ASSERT_EQ(result.datasets.size(), 2u);

        const auto& main = result.datasets[0];
        EXPECT_EQ(main.block, "<main>");
        EXPECT_EQ(main.outputs, (Names{"work.base", "stage.flags"}));
        EXPECT_EQ(main.inputs, (Names{"dwh.customers", "dwh.extra"}));

        const auto& sorter = result.datasets[1];
        EXPECT_EQ(sorter.block, "sorter");
        EXPECT_EQ(sorter.inputs, (Names{"work.base", "work.sorted"}));
        EXPECT_EQ(sorter.outputs, Names{"work.sorted"});
    }

    TEST(BuiltinMacroNamesTest, ContainsLanguageStatements) {
        const auto& names = builtin_macro_names();

        for (const auto* name : {"LET", "PUT", "IF", "DO", "MACRO", "MEND", "INCLUDE", "STR", "EVAL"}) {
            EXPECT_TRUE(names.contains(name)) << name;
        }
        EXPECT_FALSE(names.contains("LOAD"));
    }

}  // namespace sasa::analyzers
