#pragma once

#include <process_analysis/types.hpp>
#include <process_model/graph.hpp>
#include <optional>
#include <string_view>

namespace process_analysis {

std::string_view to_string(WeightMetric metric);
std::optional<WeightMetric> metric_from_string(std::string_view name);

// Sum of the chosen attribute over the path's nodes; absent values count as 0.
double path_weight(const process_model::ProcessGraph& graph, const Path& path, WeightMetric metric);

// The start->end path with the largest weight. Ties go to the path with fewer
// nodes, then to the lexicographically smallest id sequence, so the result does
// not depend on enumeration order. Throws NoPathError when no path exists.
// When the length limit cut the search short before any path was found, the
// result has no nodes and limit_exceeded set instead.
CriticalPath find_critical_path(const process_model::ProcessGraph& graph,
    WeightMetric metric = WeightMetric::Duration,
    const PathOptions& options = {});

// Same selection over an already enumerated path set.
CriticalPath select_critical_path(const process_model::ProcessGraph& graph,
    const PathSet& paths,
    WeightMetric metric = WeightMetric::Duration);

} // namespace process_analysis
