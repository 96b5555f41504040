#include <process_analysis/process_statistics.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace process_analysis {

namespace {

bool is_pseudo_role(const std::string& role) {
    return role.empty() || role == "System" || role == "Start" || role == "End";
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

ProcessStatistics compute_statistics(const process_model::ProcessGraph& graph) {
    using process_model::NodeKind;

    ProcessStatistics stats;
    stats.total_nodes = graph.node_count();
    stats.total_edges = graph.edge_count();
    std::set<std::string> roles;

    for (const auto& n : graph.nodes()) {
        switch (n.kind) {
        case NodeKind::Start: ++stats.start_count; break;
        case NodeKind::End: ++stats.end_count; break;
        case NodeKind::Task: ++stats.task_count; break;
        case NodeKind::Gateway: ++stats.gateway_count; break;
        case NodeKind::Event: ++stats.event_count; break;
        }
        stats.total_duration += n.attributes.duration.value_or(0.0);
        stats.total_cost += n.attributes.cost.value_or(0.0);
        if (n.attributes.role && !is_pseudo_role(*n.attributes.role))
            roles.insert(*n.attributes.role);
    }

    stats.total_duration_hours = std::round(stats.total_duration / 60.0 * 100.0) / 100.0;
    stats.required_roles.assign(roles.begin(), roles.end());
    stats.dead_ends = graph.dead_ends();
    return stats;
}

std::vector<std::string> find_nodes_by_label(const process_model::ProcessGraph& graph,
    const std::string& text,
    std::optional<process_model::NodeKind> kind)
{
    const std::string needle = lowercase(text);
    std::vector<std::string> out;
    for (const auto& n : graph.nodes()) {
        if (kind && n.kind != *kind) continue;
        if (lowercase(n.label).find(needle) != std::string::npos) out.push_back(n.id);
    }
    return out;
}

} // namespace process_analysis
