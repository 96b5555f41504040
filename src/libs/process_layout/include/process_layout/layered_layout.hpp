#pragma once

#include <process_layout/types.hpp>
#include <process_model/graph.hpp>
#include <vector>

namespace process_layout {

// Layered layout: multi-source BFS distance from the roots gives the layer
// (y), a stable ordering inside each layer gives the slot (x). Pure function of
// the graph structure and the config; nothing is cached between calls.
LayoutResult layout_process_graph(const process_model::ProcessGraph& graph,
    const LayoutConfig& config = {});

// Start nodes; else nodes without predecessors; else the smallest node id
// (degenerate is set in that last case). Empty for an empty graph.
std::vector<std::string> pick_layout_roots(const process_model::ProcessGraph& graph, bool& degenerate);

} // namespace process_layout
