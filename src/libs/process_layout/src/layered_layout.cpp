#include <process_layout/layered_layout.hpp>
#include <process_model/log.hpp>
#include <algorithm>
#include <limits>
#include <map>
#include <queue>

namespace process_layout {

namespace {

constexpr std::size_t no_parent = std::numeric_limits<std::size_t>::max();

struct SlotKey {
    std::size_t parent_order = no_parent;
    bool isolated = false;
    const std::string* id = nullptr;
    std::size_t index = 0;
};

bool slot_less(const SlotKey& a, const SlotKey& b) {
    if (a.parent_order != b.parent_order) return a.parent_order < b.parent_order;
    if (a.isolated != b.isolated) return !a.isolated;
    return *a.id < *b.id;
}

} // namespace

const NodePosition* LayoutResult::find(const std::string& node_id) const {
    for (const auto& p : positions)
        if (p.node_id == node_id) return &p;
    return nullptr;
}

std::vector<std::string> pick_layout_roots(const process_model::ProcessGraph& graph, bool& degenerate) {
    degenerate = false;
    std::vector<std::string> roots = graph.nodes_of_kind(process_model::NodeKind::Start);
    if (!roots.empty()) return roots;

    for (const auto& n : graph.nodes())
        if (graph.predecessors(n.id).empty()) roots.push_back(n.id);
    if (!roots.empty() || graph.node_count() == 0) return roots;

    // Every node sits on a cycle: fall back to the smallest id.
    const auto smallest = std::min_element(graph.nodes().begin(), graph.nodes().end(),
        [](const process_model::Node& a, const process_model::Node& b) { return a.id < b.id; });
    degenerate = true;
    roots.push_back(smallest->id);
    return roots;
}

LayoutResult layout_process_graph(const process_model::ProcessGraph& graph, const LayoutConfig& config) {
    LayoutResult out;
    const auto& nodes = graph.nodes();
    if (nodes.empty()) return out;

    auto log = process_model::engine_logger();
    out.roots = pick_layout_roots(graph, out.degenerate);
    if (out.degenerate) {
        log->warn("process '{}' has no source node; layering from '{}'",
            graph.info().id, out.roots.front());
    }

    // 1. BFS distance from the roots; first visit wins so back edges never move a node.
    std::vector<int> layer(nodes.size(), -1);
    std::queue<std::size_t> bfs_queue;
    for (const auto& id : out.roots) {
        const std::size_t idx = graph.index_of(id);
        if (layer[idx] >= 0) continue;
        layer[idx] = 0;
        bfs_queue.push(idx);
    }
    while (!bfs_queue.empty()) {
        const std::size_t cur = bfs_queue.front();
        bfs_queue.pop();
        for (const auto& next_id : graph.successors(nodes[cur].id)) {
            const std::size_t next = graph.index_of(next_id);
            if (layer[next] >= 0) continue;
            layer[next] = layer[cur] + 1;
            bfs_queue.push(next);
        }
    }

    // 2. Unreached nodes go to layer 0 and are reported.
    std::vector<bool> isolated(nodes.size(), false);
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (layer[i] >= 0) continue;
        layer[i] = 0;
        isolated[i] = true;
        out.isolated.push_back(nodes[i].id);
    }

    // 3. Group by layer, then order each layer by the slot of its earliest
    //    predecessor in the layer above, tie-broken by id.
    std::map<int, std::vector<std::size_t>> levels;
    for (std::size_t i = 0; i < nodes.size(); ++i)
        levels[layer[i]].push_back(i);

    std::vector<std::size_t> slot(nodes.size(), 0);
    out.positions.reserve(nodes.size());
    for (const auto& kv : levels) {
        const int depth = kv.first;
        std::vector<SlotKey> keys;
        keys.reserve(kv.second.size());
        for (const std::size_t idx : kv.second) {
            SlotKey key;
            key.isolated = isolated[idx];
            key.id = &nodes[idx].id;
            key.index = idx;
            if (depth > 0) {
                for (const auto& pred_id : graph.predecessors(nodes[idx].id)) {
                    const std::size_t p = graph.index_of(pred_id);
                    if (isolated[p] || layer[p] != depth - 1) continue;
                    key.parent_order = std::min(key.parent_order, slot[p]);
                }
            }
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end(), slot_less);

        for (std::size_t order = 0; order < keys.size(); ++order) {
            const std::size_t idx = keys[order].index;
            slot[idx] = order;
            NodePosition pos;
            pos.node_id = nodes[idx].id;
            pos.layer = depth;
            pos.order = order;
            pos.isolated = isolated[idx];
            pos.x = config.origin_x + static_cast<double>(order) * config.node_spacing_x;
            pos.y = config.origin_y + static_cast<double>(depth) * config.layer_spacing_y;
            out.positions.push_back(std::move(pos));
        }
    }
    out.layer_count = levels.size();

    if (!out.isolated.empty()) {
        log->warn("process '{}': {} node(s) unreachable from any root", graph.info().id, out.isolated.size());
    }
    log->debug("process '{}' laid out: {} nodes in {} layers", graph.info().id, nodes.size(), out.layer_count);
    return out;
}

} // namespace process_layout
