#include <process_model/graph.hpp>
#include <process_model/errors.hpp>
#include <process_model/log.hpp>
#include <cmath>
#include <utility>

namespace process_model {

namespace {

void check_weight(const Node& n, const std::optional<double>& value, const char* name) {
    if (!value) return;
    if (!std::isfinite(*value))
        throw ValidationError("node '" + n.id + "' has invalid " + name);
}

} // namespace

ProcessGraph ProcessGraph::build(ProcessInfo info, std::vector<Node> nodes, std::vector<Edge> edges) {
    ProcessGraph g;
    g.index_.reserve(nodes.size());

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const Node& n = nodes[i];
        if (n.id.empty())
            throw ValidationError("node at position " + std::to_string(i) + " has an empty id");
        if (!g.index_.emplace(n.id, i).second)
            throw ValidationError("duplicate node id '" + n.id + "'");
        check_weight(n, n.attributes.duration, "duration");
        check_weight(n, n.attributes.cost, "cost");
    }

    g.successors_.resize(nodes.size());
    g.predecessors_.resize(nodes.size());
    for (const auto& e : edges) {
        const auto from_it = g.index_.find(e.from);
        const auto to_it = g.index_.find(e.to);
        if (from_it == g.index_.end())
            throw ValidationError("edge references unknown source node '" + e.from + "'");
        if (to_it == g.index_.end())
            throw ValidationError("edge references unknown target node '" + e.to + "'");
        g.successors_[from_it->second].push_back(e.to);
        g.predecessors_[to_it->second].push_back(e.from);
    }

    g.info_ = std::move(info);
    g.nodes_ = std::move(nodes);
    g.edges_ = std::move(edges);

    const auto dead = g.dead_ends();
    if (!dead.empty()) {
        auto log = engine_logger();
        for (const auto& id : dead)
            log->warn("process '{}': node '{}' has no outgoing edges and is not an End node", g.info_.id, id);
    }
    return g;
}

bool ProcessGraph::contains(const std::string& node_id) const {
    return index_.find(node_id) != index_.end();
}

std::size_t ProcessGraph::index_of(const std::string& node_id) const {
    const auto it = index_.find(node_id);
    if (it == index_.end()) throw UnknownNodeError(node_id);
    return it->second;
}

const Node& ProcessGraph::node(const std::string& node_id) const {
    return nodes_[index_of(node_id)];
}

const std::vector<std::string>& ProcessGraph::successors(const std::string& node_id) const {
    return successors_[index_of(node_id)];
}

const std::vector<std::string>& ProcessGraph::predecessors(const std::string& node_id) const {
    return predecessors_[index_of(node_id)];
}

std::vector<std::string> ProcessGraph::nodes_of_kind(NodeKind kind) const {
    std::vector<std::string> out;
    for (const auto& n : nodes_)
        if (n.kind == kind) out.push_back(n.id);
    return out;
}

std::vector<std::string> ProcessGraph::dead_ends() const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < nodes_.size(); ++i)
        if (successors_[i].empty() && nodes_[i].kind != NodeKind::End) out.push_back(nodes_[i].id);
    return out;
}

} // namespace process_model
