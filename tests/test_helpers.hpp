#pragma once

#include <process_model/graph.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers {

using process_model::NodeKind;

inline process_model::Node node(const std::string& id, NodeKind kind,
    std::optional<double> duration = std::nullopt,
    std::optional<double> cost = std::nullopt)
{
    process_model::Node n;
    n.id = id;
    n.label = id;
    n.kind = kind;
    n.attributes.duration = duration;
    n.attributes.cost = cost;
    return n;
}

inline process_model::ProcessGraph make_graph(std::vector<process_model::Node> nodes,
    const std::vector<std::pair<std::string, std::string>>& links,
    const std::string& process_id = "test")
{
    std::vector<process_model::Edge> edges;
    for (const auto& l : links)
        edges.push_back(process_model::Edge{ l.first, l.second, "" });
    return process_model::ProcessGraph::build({ process_id, process_id + " process" },
        std::move(nodes), std::move(edges));
}

// Start -> A -> B -> C -> End
inline process_model::ProcessGraph linear_graph() {
    return make_graph(
        { node("Start", NodeKind::Start), node("A", NodeKind::Task), node("B", NodeKind::Task),
          node("C", NodeKind::Task), node("End", NodeKind::End) },
        { {"Start", "A"}, {"A", "B"}, {"B", "C"}, {"C", "End"} },
        "linear");
}

// Start -> A, Start -> B, A -> C, B -> C, C -> End
inline process_model::ProcessGraph diamond_graph() {
    return make_graph(
        { node("Start", NodeKind::Start), node("A", NodeKind::Task), node("B", NodeKind::Task),
          node("C", NodeKind::Gateway), node("End", NodeKind::End) },
        { {"Start", "A"}, {"Start", "B"}, {"A", "C"}, {"B", "C"}, {"C", "End"} },
        "diamond");
}

// Start -> A -> B -> A (rework loop), A -> End
inline process_model::ProcessGraph feedback_graph() {
    return make_graph(
        { node("Start", NodeKind::Start), node("A", NodeKind::Task), node("B", NodeKind::Task),
          node("End", NodeKind::End) },
        { {"Start", "A"}, {"A", "B"}, {"B", "A"}, {"A", "End"} },
        "feedback");
}

inline bool is_simple(const process_model::Path& path) {
    for (std::size_t i = 0; i < path.size(); ++i)
        for (std::size_t j = i + 1; j < path.size(); ++j)
            if (path[i] == path[j]) return false;
    return true;
}

} // namespace test_helpers
