#include <process_model/types.hpp>

namespace process_model {

std::string_view to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::Start: return "Start";
    case NodeKind::End: return "End";
    case NodeKind::Task: return "Task";
    case NodeKind::Gateway: return "Gateway";
    case NodeKind::Event: return "Event";
    }
    return "Task";
}

std::optional<NodeKind> kind_from_string(std::string_view name) {
    if (name == "Start") return NodeKind::Start;
    if (name == "End") return NodeKind::End;
    if (name == "Task") return NodeKind::Task;
    if (name == "Gateway" || name == "Decision") return NodeKind::Gateway;
    if (name == "Event") return NodeKind::Event;
    return std::nullopt;
}

} // namespace process_model
