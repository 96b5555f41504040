#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace process_model {

enum class NodeKind { Start, End, Task, Gateway, Event };

std::string_view to_string(NodeKind kind);
// Canonical names plus the legacy "Decision" alias (mapped to Gateway).
std::optional<NodeKind> kind_from_string(std::string_view name);

// All attributes are absent unless the source supplied them.
struct NodeAttributes {
    std::optional<double> duration;
    std::optional<double> cost;
    std::optional<std::string> role;

    bool operator==(const NodeAttributes&) const = default;
};

struct Node {
    std::string id;
    std::string label;
    NodeKind kind = NodeKind::Task;
    NodeAttributes attributes;

    bool operator==(const Node&) const = default;
};

struct Edge {
    std::string from;
    std::string to;
    std::string label; // branch condition, may be empty

    bool operator==(const Edge&) const = default;
};

struct ProcessInfo {
    std::string id;
    std::string name;

    bool operator==(const ProcessInfo&) const = default;
};

using Path = std::vector<std::string>;

} // namespace process_model
