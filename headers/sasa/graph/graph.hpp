//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef SASA_GRAPH_HPP
#define SASA_GRAPH_HPP

/**
 * @file graph.hpp
 * @brief Directed multigraph behind the macro call graph.
 *
 * Calls are recorded one by one, so the same caller/callee pair usually
 * appears many times. Those are folded into a single edge with a
 * multiplicity. Nodes and each node's successors stay in insertion order,
 * which keeps cycle reports and the topological order reproducible.
 */

#include "sasa/result.hpp"
#include "sasa/error.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace sasa::graph {

    /**
     * A cycle as the path that closes it; the first node is repeated at the
     * end, so a self-call reads [a, a].
     */
    struct Cycle {
        std::vector<std::string> nodes;
    };

    struct CycleDetectionResult {
        bool has_cycles = false;
        std::vector<Cycle> cycles;
    };

    class DirectedGraph {
    public:
        using NodeId = std::size_t;

        /// Returns the node's id, inserting it when new.
        NodeId add_node(const std::string& node);

        /// Adds @p count occurrences of from -> to, creating missing nodes.
        void add_edge(const std::string& from, const std::string& to, std::size_t count = 1);

        [[nodiscard]] bool has_node(const std::string& node) const;
        [[nodiscard]] bool has_edge(const std::string& from, const std::string& to) const;

        [[nodiscard]] const std::vector<std::string>& nodes() const { return names_; }
        [[nodiscard]] std::size_t node_count() const { return names_.size(); }

        /// Distinct edges; multiplicity is not counted.
        [[nodiscard]] std::size_t edge_count() const { return edge_count_; }

        /// How many times from -> to was added, 0 when absent.
        [[nodiscard]] std::size_t multiplicity(const std::string& from, const std::string& to) const;

        [[nodiscard]] std::vector<std::string> successors(const std::string& node) const;
        [[nodiscard]] std::size_t in_degree(const std::string& node) const;
        [[nodiscard]] std::size_t out_degree(const std::string& node) const;

    private:
        struct Edge {
            NodeId target;
            std::size_t count;
        };

        friend CycleDetectionResult detect_cycles(const DirectedGraph&, std::size_t);
        friend Result<std::vector<std::string>, Error> topological_sort(const DirectedGraph&);

        [[nodiscard]] const Edge* find_edge(const std::string& from, const std::string& to) const;

        std::vector<std::string> names_;
        std::unordered_map<std::string, NodeId> ids_;
        std::vector<std::vector<Edge>> out_;
        std::vector<std::size_t> in_degree_;
        std::size_t edge_count_ = 0;
    };

    /**
     * Depth-first search from each node in insertion order, reporting every
     * back edge as a cycle. Stops after @p max_cycles cycles.
     */
    [[nodiscard]] CycleDetectionResult detect_cycles(
        const DirectedGraph& graph,
        std::size_t max_cycles = 10
    );

    /**
     * Kahn's algorithm seeded in insertion order; every node precedes its
     * successors. Fails with AnalysisError when the graph has a cycle.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> topological_sort(
        const DirectedGraph& graph
    );

}  // namespace sasa::graph

#endif //SASA_GRAPH_HPP
