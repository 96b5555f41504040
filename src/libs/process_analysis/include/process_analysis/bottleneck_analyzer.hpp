#pragma once

#include <process_analysis/types.hpp>
#include <process_model/graph.hpp>
#include <vector>

namespace process_analysis {

// Nodes with more than one distinct predecessor, ranked by that count
// (descending), ties by node id. Parallel edges count once.
std::vector<Bottleneck> find_bottlenecks(const process_model::ProcessGraph& graph);

// Nodes with more than one distinct successor, in graph order.
std::vector<BranchPoint> find_branch_points(const process_model::ProcessGraph& graph);

} // namespace process_analysis
