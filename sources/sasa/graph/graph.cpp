//
// Created by gregorian-rayne on 12/28/25.
//

#include "sasa/graph/graph.hpp"

#include <algorithm>
#include <deque>

namespace sasa::graph {

    DirectedGraph::NodeId DirectedGraph::add_node(const std::string& node) {
        const auto [it, inserted] = ids_.try_emplace(node, names_.size());
        if (inserted) {
            names_.push_back(node);
            out_.emplace_back();
            in_degree_.push_back(0);
        }
        return it->second;
    }

    void DirectedGraph::add_edge(const std::string& from, const std::string& to, const std::size_t count) {
        const auto source = add_node(from);
        const auto target = add_node(to);

        auto& edges = out_[source];
        const auto it = std::ranges::find(edges, target, &Edge::target);
        if (it != edges.end()) {
            it->count += count;
            return;
        }
        edges.push_back({target, count});
        ++in_degree_[target];
        ++edge_count_;
    }

    bool DirectedGraph::has_node(const std::string& node) const {
        return ids_.contains(node);
    }

    bool DirectedGraph::has_edge(const std::string& from, const std::string& to) const {
        return find_edge(from, to) != nullptr;
    }

    std::size_t DirectedGraph::multiplicity(const std::string& from, const std::string& to) const {
        const auto* edge = find_edge(from, to);
        return edge ? edge->count : 0;
    }

    const DirectedGraph::Edge* DirectedGraph::find_edge(const std::string& from, const std::string& to) const {
        const auto source = ids_.find(from);
        const auto target = ids_.find(to);
        if (source == ids_.end() || target == ids_.end()) {
            return nullptr;
        }
        const auto& edges = out_[source->second];
        const auto it = std::ranges::find(edges, target->second, &Edge::target);
        return it == edges.end() ? nullptr : &*it;
    }

    std::vector<std::string> DirectedGraph::successors(const std::string& node) const {
        std::vector<std::string> result;
        if (const auto it = ids_.find(node); it != ids_.end()) {
            for (const auto& edge : out_[it->second]) {
                result.push_back(names_[edge.target]);
            }
        }
        return result;
    }

    std::size_t DirectedGraph::in_degree(const std::string& node) const {
        const auto it = ids_.find(node);
        return it == ids_.end() ? 0 : in_degree_[it->second];
    }

    std::size_t DirectedGraph::out_degree(const std::string& node) const {
        const auto it = ids_.find(node);
        return it == ids_.end() ? 0 : out_[it->second].size();
    }

    CycleDetectionResult detect_cycles(const DirectedGraph& graph, const std::size_t max_cycles) {
        enum class Mark { Unvisited, OnPath, Done };

        CycleDetectionResult result;
        std::vector<Mark> marks(graph.node_count(), Mark::Unvisited);

        // Explicit DFS stack: the node and the index of its next successor.
        std::vector<std::pair<DirectedGraph::NodeId, std::size_t>> stack;

        for (DirectedGraph::NodeId start = 0; start < graph.node_count(); ++start) {
            if (marks[start] != Mark::Unvisited) {
                continue;
            }
            marks[start] = Mark::OnPath;
            stack.emplace_back(start, 0);

            while (!stack.empty() && result.cycles.size() < max_cycles) {
                auto& [node, next] = stack.back();
                const auto& edges = graph.out_[node];
                if (next == edges.size()) {
                    marks[node] = Mark::Done;
                    stack.pop_back();
                    continue;
                }

                const auto target = edges[next++].target;
                if (marks[target] == Mark::Unvisited) {
                    marks[target] = Mark::OnPath;
                    stack.emplace_back(target, 0);
                } else if (marks[target] == Mark::OnPath) {
                    const auto from = std::ranges::find_if(stack, [target](const auto& frame) {
                        return frame.first == target;
                    });
                    Cycle cycle;
                    for (auto it = from; it != stack.end(); ++it) {
                        cycle.nodes.push_back(graph.names_[it->first]);
                    }
                    cycle.nodes.push_back(graph.names_[target]);
                    result.cycles.push_back(std::move(cycle));
                }
            }

            if (result.cycles.size() >= max_cycles) {
                break;
            }
        }

        result.has_cycles = !result.cycles.empty();
        return result;
    }

    Result<std::vector<std::string>, Error> topological_sort(const DirectedGraph& graph) {
        if (detect_cycles(graph, 1).has_cycles) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::analysis_error("Graph contains cycles, cannot perform topological sort")
            );
        }

        auto remaining = graph.in_degree_;
        std::deque<DirectedGraph::NodeId> ready;
        for (DirectedGraph::NodeId id = 0; id < graph.node_count(); ++id) {
            if (remaining[id] == 0) {
                ready.push_back(id);
            }
        }

        std::vector<std::string> order;
        order.reserve(graph.node_count());
        while (!ready.empty()) {
            const auto id = ready.front();
            ready.pop_front();
            order.push_back(graph.names_[id]);
            for (const auto& edge : graph.out_[id]) {
                if (--remaining[edge.target] == 0) {
                    ready.push_back(edge.target);
                }
            }
        }

        return Result<std::vector<std::string>, Error>::success(std::move(order));
    }

}  // namespace sasa::graph
