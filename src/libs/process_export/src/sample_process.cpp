#include <process_export/sample_process.hpp>
#include <optional>
#include <vector>

namespace process_export {

process_model::ProcessGraph make_sample_process() {
    using process_model::NodeKind;

    std::vector<process_model::Node> nodes;
    std::vector<process_model::Edge> edges;

    auto add_node = [&](const char* id, const char* label, NodeKind kind,
                        std::optional<double> duration = std::nullopt,
                        std::optional<double> cost = std::nullopt,
                        const char* role = nullptr)
    {
        process_model::Node n;
        n.id = id;
        n.label = label;
        n.kind = kind;
        n.attributes.duration = duration;
        n.attributes.cost = cost;
        if (role) n.attributes.role = role;
        nodes.push_back(std::move(n));
    };
    auto connect = [&](const char* from, const char* to, const char* label = "") {
        edges.push_back(process_model::Edge{ from, to, label });
    };

    add_node("start", "Order received", NodeKind::Start, std::nullopt, std::nullopt, "System");
    add_node("register", "Register order", NodeKind::Task, 10, 5, "Clerk");
    add_node("review", "Review order", NodeKind::Task, 30, 20, "Manager");
    add_node("approved", "Approved?", NodeKind::Gateway);
    add_node("rework", "Rework order", NodeKind::Task, 45, 35, "Clerk");
    add_node("credit", "Credit check", NodeKind::Task, 20, 15, "Finance");
    add_node("stock", "Reserve stock", NodeKind::Task, 15, 8, "Warehouse");
    add_node("ready", "Order ready", NodeKind::Event);
    add_node("ship", "Ship order", NodeKind::Task, 60, 40, "Warehouse");
    add_node("reject", "Notify rejection", NodeKind::Task, 5, 2, "Clerk");
    add_node("shipped", "Order shipped", NodeKind::End, std::nullopt, std::nullopt, "End");
    add_node("rejected", "Order rejected", NodeKind::End);

    connect("start", "register");
    connect("register", "review");
    connect("review", "approved");
    connect("approved", "credit", "approved");
    connect("approved", "stock", "approved");
    connect("approved", "rework", "needs changes");
    connect("approved", "reject", "rejected");
    connect("rework", "review");
    connect("credit", "ready");
    connect("stock", "ready");
    connect("ready", "ship");
    connect("ship", "shipped");
    connect("reject", "rejected");

    return process_model::ProcessGraph::build({ "order-handling", "Order handling" },
        std::move(nodes), std::move(edges));
}

} // namespace process_export
