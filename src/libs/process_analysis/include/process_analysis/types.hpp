#pragma once

#include <process_model/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace process_analysis {

using process_model::Path;

struct PathOptions {
    process_model::NodeKind start_kind = process_model::NodeKind::Start;
    process_model::NodeKind end_kind = process_model::NodeKind::End;
    // Maximum number of nodes on a path; unset means 2 x node count.
    std::optional<std::size_t> max_path_length;
};

struct PathSet {
    // Discovery order: start nodes in graph order, DFS order over successors from each.
    std::vector<Path> paths;
    // Set when max_path_length cut at least one start node's search short.
    bool limit_exceeded = false;
    // Start nodes whose search was cut short.
    std::vector<std::string> truncated;
};

struct Bottleneck {
    std::string node_id;
    std::size_t distinct_predecessor_count = 0;

    bool operator==(const Bottleneck&) const = default;
};

enum class WeightMetric { Duration, Cost };

struct CriticalPath {
    Path nodes;
    double weight = 0;
    WeightMetric metric = WeightMetric::Duration;
    // Carried over from the path enumeration the result was chosen from.
    bool limit_exceeded = false;
};

struct BranchPoint {
    std::string node_id;
    std::vector<std::string> targets; // distinct, first-edge order
};

struct ProcessStatistics {
    std::size_t total_nodes = 0;
    std::size_t total_edges = 0;
    std::size_t start_count = 0;
    std::size_t end_count = 0;
    std::size_t task_count = 0;
    std::size_t gateway_count = 0;
    std::size_t event_count = 0;
    std::vector<std::string> dead_ends;
    double total_duration = 0;       // minutes
    double total_duration_hours = 0; // rounded to two decimals
    double total_cost = 0;
    // Distinct, sorted; System/Start/End pseudo-roles are left out.
    std::vector<std::string> required_roles;
};

} // namespace process_analysis
