#include <process_analysis/critical_path.hpp>
#include <process_analysis/path_enumerator.hpp>
#include <process_model/errors.hpp>
#include <process_model/log.hpp>

namespace process_analysis {

namespace {

bool outranks(double weight, const Path& path, double best_weight, const Path& best) {
    if (weight != best_weight) return weight > best_weight;
    if (path.size() != best.size()) return path.size() < best.size();
    return path < best;
}

} // namespace

std::string_view to_string(WeightMetric metric) {
    switch (metric) {
    case WeightMetric::Duration: return "duration";
    case WeightMetric::Cost: return "cost";
    }
    return "duration";
}

std::optional<WeightMetric> metric_from_string(std::string_view name) {
    if (name == "duration") return WeightMetric::Duration;
    if (name == "cost") return WeightMetric::Cost;
    return std::nullopt;
}

double path_weight(const process_model::ProcessGraph& graph, const Path& path, WeightMetric metric) {
    double sum = 0.0;
    for (const auto& id : path) {
        const auto& attrs = graph.node(id).attributes;
        const auto& value = metric == WeightMetric::Duration ? attrs.duration : attrs.cost;
        sum += value.value_or(0.0);
    }
    return sum;
}

CriticalPath find_critical_path(const process_model::ProcessGraph& graph,
    WeightMetric metric,
    const PathOptions& options)
{
    return select_critical_path(graph, enumerate_paths(graph, options), metric);
}

CriticalPath select_critical_path(const process_model::ProcessGraph& graph,
    const PathSet& set,
    WeightMetric metric)
{
    CriticalPath out;
    out.metric = metric;
    out.limit_exceeded = set.limit_exceeded;
    if (set.paths.empty()) {
        // A truncated search proves nothing about reachability.
        if (set.limit_exceeded) return out;
        throw process_model::NoPathError(graph.info().id);
    }

    out.nodes = set.paths.front();
    out.weight = path_weight(graph, out.nodes, metric);
    for (std::size_t i = 1; i < set.paths.size(); ++i) {
        const double w = path_weight(graph, set.paths[i], metric);
        if (outranks(w, set.paths[i], out.weight, out.nodes)) {
            out.weight = w;
            out.nodes = set.paths[i];
        }
    }

    process_model::engine_logger()->debug("process '{}': critical path by {} has {} node(s), weight {}",
        graph.info().id, to_string(metric), out.nodes.size(), out.weight);
    return out;
}

} // namespace process_analysis
