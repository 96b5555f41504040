#pragma once

#include <process_analysis/types.hpp>
#include <process_model/graph.hpp>

namespace process_analysis {

// Every simple path from each start-kind node to any end-kind node, one DFS
// per start node. Reaching an end-kind node records the path and backtracks.
// The visited set is scoped to the path being built, so loops terminate and no
// node repeats. A search that would exceed max_path_length stops for that
// start node and the start is listed in PathSet::truncated.
PathSet enumerate_paths(const process_model::ProcessGraph& graph, const PathOptions& options = {});

} // namespace process_analysis
