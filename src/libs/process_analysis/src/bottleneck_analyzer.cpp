#include <process_analysis/bottleneck_analyzer.hpp>
#include <algorithm>
#include <unordered_set>

namespace process_analysis {

std::vector<Bottleneck> find_bottlenecks(const process_model::ProcessGraph& graph) {
    std::vector<Bottleneck> out;
    for (const auto& n : graph.nodes()) {
        const auto& preds = graph.predecessors(n.id);
        if (preds.size() < 2) continue;
        const std::unordered_set<std::string> distinct(preds.begin(), preds.end());
        if (distinct.size() < 2) continue;
        out.push_back({n.id, distinct.size()});
    }
    std::sort(out.begin(), out.end(), [](const Bottleneck& a, const Bottleneck& b) {
        if (a.distinct_predecessor_count != b.distinct_predecessor_count)
            return a.distinct_predecessor_count > b.distinct_predecessor_count;
        return a.node_id < b.node_id;
    });
    return out;
}

std::vector<BranchPoint> find_branch_points(const process_model::ProcessGraph& graph) {
    std::vector<BranchPoint> out;
    for (const auto& n : graph.nodes()) {
        BranchPoint bp;
        bp.node_id = n.id;
        for (const auto& next : graph.successors(n.id)) {
            if (std::find(bp.targets.begin(), bp.targets.end(), next) == bp.targets.end())
                bp.targets.push_back(next);
        }
        if (bp.targets.size() > 1) out.push_back(std::move(bp));
    }
    return out;
}

} // namespace process_analysis
