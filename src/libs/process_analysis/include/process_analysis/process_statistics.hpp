#pragma once

#include <process_analysis/types.hpp>
#include <process_model/graph.hpp>
#include <optional>
#include <string>
#include <vector>

namespace process_analysis {

ProcessStatistics compute_statistics(const process_model::ProcessGraph& graph);

// Case-insensitive substring match on node labels, optionally limited to one kind.
std::vector<std::string> find_nodes_by_label(const process_model::ProcessGraph& graph,
    const std::string& text,
    std::optional<process_model::NodeKind> kind = std::nullopt);

} // namespace process_analysis
