//
// Created by gregorian-rayne on 1/8/26.
//

#include "sasa/graph/graph.hpp"

#include <gtest/gtest.h>
#include <algorithm>

namespace sasa::graph
{
    class DirectedGraphTest : public ::testing::Test {
    protected:
        void SetUp() override {
            // <main> -> LOAD -> EXTRACT
            //        -> REPORT
            graph.add_edge("<MAIN>", "LOAD");
            graph.add_edge("LOAD", "EXTRACT");
            graph.add_edge("<MAIN>", "REPORT");
        }

        DirectedGraph graph;
    };

    TEST_F(DirectedGraphTest, NodesKeepInsertionOrder) {
        const auto& nodes = graph.nodes();

        ASSERT_EQ(nodes.size(), 4u);
        EXPECT_EQ(nodes[0], "<MAIN>");
        EXPECT_EQ(nodes[1], "LOAD");
        EXPECT_EQ(nodes[2], "EXTRACT");
        EXPECT_EQ(nodes[3], "REPORT");
    }

    TEST_F(DirectedGraphTest, EdgesAndDegrees) {
        EXPECT_EQ(graph.edge_count(), 3u);
        EXPECT_TRUE(graph.has_edge("LOAD", "EXTRACT"));
        EXPECT_FALSE(graph.has_edge("EXTRACT", "LOAD"));

        EXPECT_EQ(graph.out_degree("<MAIN>"), 2u);
        EXPECT_EQ(graph.in_degree("<MAIN>"), 0u);
        EXPECT_EQ(graph.in_degree("EXTRACT"), 1u);
        EXPECT_EQ(graph.out_degree("UNKNOWN"), 0u);
    }

    TEST_F(DirectedGraphTest, RepeatedCallsRaiseMultiplicity) {
        graph.add_edge("LOAD", "EXTRACT");
        graph.add_edge("LOAD", "EXTRACT", 3);

        EXPECT_EQ(graph.edge_count(), 3u);
        EXPECT_EQ(graph.multiplicity("LOAD", "EXTRACT"), 5u);
        EXPECT_EQ(graph.multiplicity("EXTRACT", "LOAD"), 0u);
        EXPECT_EQ(graph.in_degree("EXTRACT"), 1u);
    }

    TEST_F(DirectedGraphTest, AddNodeIsIdempotent) {
        const auto id = graph.add_node("LOAD");

        EXPECT_EQ(id, 1u);
        EXPECT_EQ(graph.node_count(), 4u);
        EXPECT_EQ(graph.add_node("UNUSED"), 4u);
        EXPECT_TRUE(graph.successors("UNUSED").empty());
    }

    TEST_F(DirectedGraphTest, TopologicalSortPutsCallersFirst) {
        const auto sorted = topological_sort(graph);
        ASSERT_TRUE(sorted.is_ok());

        const auto& order = sorted.value();
        const auto pos = [&](const std::string& node) {
            return std::ranges::find(order, node) - order.begin();
        };
        EXPECT_LT(pos("<MAIN>"), pos("LOAD"));
        EXPECT_LT(pos("LOAD"), pos("EXTRACT"));
    }

    TEST_F(DirectedGraphTest, NoCyclesInTree) {
        EXPECT_FALSE(detect_cycles(graph).has_cycles);
    }

    TEST(GraphCycleTest, DetectsRecursion) {
        DirectedGraph graph;
        graph.add_edge("A", "B");
        graph.add_edge("B", "A");

        const auto result = detect_cycles(graph);
        ASSERT_TRUE(result.has_cycles);
        ASSERT_EQ(result.cycles.size(), 1u);
        EXPECT_EQ(result.cycles[0].nodes, (std::vector<std::string>{"A", "B", "A"}));

        const auto sorted = topological_sort(graph);
        ASSERT_TRUE(sorted.is_err());
        EXPECT_EQ(sorted.error().code(), ErrorCode::AnalysisError);
    }

    TEST(GraphCycleTest, SelfLoop) {
        DirectedGraph graph;
        graph.add_edge("FACT", "FACT");

        const auto result = detect_cycles(graph);
        ASSERT_TRUE(result.has_cycles);
        EXPECT_EQ(result.cycles[0].nodes, (std::vector<std::string>{"FACT", "FACT"}));
    }

    TEST(GraphCycleTest, CyclesFollowInsertionOrderAndRespectLimit) {
        DirectedGraph graph;
        graph.add_edge("R", "R");
        graph.add_edge("P", "Q");
        graph.add_edge("Q", "P");
        graph.add_edge("Q", "S");

        const auto all = detect_cycles(graph);
        ASSERT_EQ(all.cycles.size(), 2u);
        EXPECT_EQ(all.cycles[0].nodes, (std::vector<std::string>{"R", "R"}));
        EXPECT_EQ(all.cycles[1].nodes, (std::vector<std::string>{"P", "Q", "P"}));

        const auto first = detect_cycles(graph, 1);
        EXPECT_EQ(first.cycles.size(), 1u);
    }

}  // namespace sasa::graph
