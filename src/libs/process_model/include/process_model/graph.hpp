#pragma once

#include <process_model/types.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace process_model {

// Immutable, validated process graph. Adjacency is indexed once at build time;
// every query afterwards is read-only, so one instance may be shared between
// threads as long as nobody holds a non-const reference to it.
class ProcessGraph {
public:
    // Empty graph; equivalent to build({}, {}, {}).
    ProcessGraph() = default;

    // Throws ValidationError on a duplicated or empty node id, an edge that
    // references an unknown node, or a non-finite weight attribute.
    static ProcessGraph build(ProcessInfo info, std::vector<Node> nodes, std::vector<Edge> edges);

    const ProcessInfo& info() const { return info_; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edges_.size(); }

    bool contains(const std::string& node_id) const;
    // Position of the node in insertion order. Throws UnknownNodeError.
    std::size_t index_of(const std::string& node_id) const;
    const Node& node(const std::string& node_id) const;

    // One entry per edge, in edge insertion order; parallel edges repeat.
    const std::vector<std::string>& successors(const std::string& node_id) const;
    const std::vector<std::string>& predecessors(const std::string& node_id) const;

    std::vector<std::string> nodes_of_kind(NodeKind kind) const;
    // Nodes without outgoing edges whose kind is not End.
    std::vector<std::string> dead_ends() const;

private:
    ProcessInfo info_;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::vector<std::string>> successors_;
    std::vector<std::vector<std::string>> predecessors_;
};

} // namespace process_model
