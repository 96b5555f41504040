#include <process_export/json_document.hpp>
#include <process_model/errors.hpp>
#include <process_model/log.hpp>
#include <process_analysis/critical_path.hpp>
#include <cstdint>
#include <limits>
#include <map>

namespace process_export {

namespace {

using nlohmann::json;
using process_model::ValidationError;

// ---- export ----

json node_to_json(const process_model::Node& n) {
    json out = {
        {"id", n.id},
        {"label", n.label},
        {"kind", std::string(process_model::to_string(n.kind))},
    };
    if (n.attributes.duration) out["duration"] = *n.attributes.duration;
    if (n.attributes.cost) out["cost"] = *n.attributes.cost;
    if (n.attributes.role) out["role"] = *n.attributes.role;
    return out;
}

json edge_to_json(const process_model::Edge& e) {
    json out = {{"from", e.from}, {"to", e.to}};
    if (!e.label.empty()) out["label"] = e.label;
    return out;
}

json layout_to_json(const process_layout::LayoutResult& layout) {
    json out = json::array();
    for (const auto& p : layout.positions)
        out.push_back({{"id", p.node_id}, {"x", p.x}, {"y", p.y}, {"layer", p.layer}});
    return out;
}

// ---- import ----

const json* member(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

std::string required_string(const json& j, const char* key, const std::string& where) {
    const json* v = member(j, key);
    if (!v || !v->is_string()) throw ValidationError(where + ": missing string field '" + key + "'");
    return v->get<std::string>();
}

std::string optional_string(const json& j, const char* key, const std::string& where) {
    const json* v = member(j, key);
    if (!v) return "";
    if (!v->is_string()) throw ValidationError(where + ": field '" + key + "' must be a string");
    return v->get<std::string>();
}

std::optional<double> optional_number(const json& j, const char* key, const std::string& where) {
    const json* v = member(j, key);
    if (!v) return std::nullopt;
    if (!v->is_number()) throw ValidationError(where + ": field '" + key + "' must be a number");
    return v->get<double>();
}

double required_number(const json& j, const char* key, const std::string& where) {
    const auto v = optional_number(j, key, where);
    if (!v) throw ValidationError(where + ": missing number field '" + key + "'");
    return *v;
}

// Non-negative integer no larger than limit; fractional or out-of-range values are rejected.
std::uint64_t required_count(const json& j, const char* key, const std::string& where, std::uint64_t limit) {
    const json* v = member(j, key);
    if (!v || !v->is_number_integer())
        throw ValidationError(where + ": field '" + key + "' must be a non-negative integer");
    if (!v->is_number_unsigned() && v->get<std::int64_t>() < 0)
        throw ValidationError(where + ": field '" + key + "' must be a non-negative integer");
    const auto value = v->get<std::uint64_t>();
    if (value > limit) throw ValidationError(where + ": field '" + key + "' is out of range");
    return value;
}

const json& required_array(const json& j, const char* key) {
    const json* v = member(j, key);
    if (!v || !v->is_array()) throw ValidationError(std::string("document: missing array '") + key + "'");
    return *v;
}

const json& require_object(const json& j, const std::string& where) {
    if (!j.is_object()) throw ValidationError(where + ": expected an object");
    return j;
}

void require_known(const process_model::ProcessGraph& graph, const std::string& id, const std::string& where) {
    if (!graph.contains(id)) throw ValidationError(where + ": unknown node id '" + id + "'");
}

process_model::Node parse_node(const json& n, std::size_t index) {
    const std::string where = "nodes[" + std::to_string(index) + "]";
    require_object(n, where);
    process_model::Node node;
    node.id = required_string(n, "id", where);
    node.label = optional_string(n, "label", where);
    const std::string kind = required_string(n, "kind", where);
    const auto parsed = process_model::kind_from_string(kind);
    if (!parsed) throw ValidationError(where + ": unknown kind '" + kind + "'");
    node.kind = *parsed;
    node.attributes.duration = optional_number(n, "duration", where);
    node.attributes.cost = optional_number(n, "cost", where);
    if (member(n, "role")) node.attributes.role = optional_string(n, "role", where);
    return node;
}

process_model::Edge parse_edge(const json& e, std::size_t index) {
    const std::string where = "edges[" + std::to_string(index) + "]";
    require_object(e, where);
    process_model::Edge edge;
    edge.from = required_string(e, "from", where);
    edge.to = required_string(e, "to", where);
    edge.label = optional_string(e, "label", where);
    return edge;
}

process_model::Path parse_path(const json& p, const process_model::ProcessGraph& graph, const std::string& where) {
    if (!p.is_array()) throw ValidationError(where + ": expected an array of node ids");
    process_model::Path path;
    for (const auto& id : p) {
        if (!id.is_string()) throw ValidationError(where + ": node ids must be strings");
        path.push_back(id.get<std::string>());
        require_known(graph, path.back(), where);
    }
    return path;
}

process_layout::LayoutResult parse_layout(const json& arr, const process_model::ProcessGraph& graph) {
    process_layout::LayoutResult layout;
    std::map<int, std::size_t> per_layer;
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const std::string where = "layout[" + std::to_string(i) + "]";
        const json& p = require_object(arr[i], where);
        process_layout::NodePosition pos;
        pos.node_id = required_string(p, "id", where);
        require_known(graph, pos.node_id, where);
        pos.x = required_number(p, "x", where);
        pos.y = required_number(p, "y", where);
        pos.layer = static_cast<int>(required_count(p, "layer", where,
            static_cast<std::uint64_t>(std::numeric_limits<int>::max())));
        pos.order = per_layer[pos.layer]++;
        layout.positions.push_back(std::move(pos));
    }
    layout.layer_count = per_layer.empty() ? 0 : static_cast<std::size_t>(per_layer.rbegin()->first) + 1;
    return layout;
}

std::vector<process_analysis::Bottleneck> parse_bottlenecks(const json& arr, const process_model::ProcessGraph& graph) {
    std::vector<process_analysis::Bottleneck> out;
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const std::string where = "bottlenecks[" + std::to_string(i) + "]";
        const json& b = require_object(arr[i], where);
        process_analysis::Bottleneck bn;
        bn.node_id = required_string(b, "id", where);
        require_known(graph, bn.node_id, where);
        bn.distinct_predecessor_count = static_cast<std::size_t>(required_count(b, "distinctPredecessorCount", where,
            static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())));
        out.push_back(std::move(bn));
    }
    return out;
}

process_analysis::CriticalPath parse_critical_path(const json& c, const process_model::ProcessGraph& graph) {
    const std::string where = "criticalPath";
    require_object(c, where);
    process_analysis::CriticalPath cp;
    const json* nodes = member(c, "nodes");
    if (!nodes) throw ValidationError(where + ": missing array 'nodes'");
    cp.nodes = parse_path(*nodes, graph, where);
    cp.weight = required_number(c, "weight", where);
    const std::string metric = optional_string(c, "metric", where);
    if (!metric.empty()) {
        const auto parsed = process_analysis::metric_from_string(metric);
        if (!parsed) throw ValidationError(where + ": unknown metric '" + metric + "'");
        cp.metric = *parsed;
    }
    return cp;
}

} // namespace

json export_process(const process_model::ProcessGraph& graph, const AnalysisSections& analysis) {
    json doc;
    doc["process"] = {{"id", graph.info().id}, {"name", graph.info().name}};

    json nodes = json::array();
    for (const auto& n : graph.nodes())
        nodes.push_back(node_to_json(n));
    doc["nodes"] = std::move(nodes);

    json edges = json::array();
    for (const auto& e : graph.edges())
        edges.push_back(edge_to_json(e));
    doc["edges"] = std::move(edges);

    if (analysis.layout) doc["layout"] = layout_to_json(*analysis.layout);
    if (analysis.paths) doc["paths"] = *analysis.paths;
    if (analysis.bottlenecks) {
        json arr = json::array();
        for (const auto& b : *analysis.bottlenecks)
            arr.push_back({{"id", b.node_id}, {"distinctPredecessorCount", b.distinct_predecessor_count}});
        doc["bottlenecks"] = std::move(arr);
    }
    if (analysis.critical_path) {
        const auto& cp = *analysis.critical_path;
        doc["criticalPath"] = {
            {"nodes", cp.nodes},
            {"weight", cp.weight},
            {"metric", std::string(process_analysis::to_string(cp.metric))},
        };
    }
    return doc;
}

std::string export_process_to_string(const process_model::ProcessGraph& graph,
    const AnalysisSections& analysis,
    int indent)
{
    return export_process(graph, analysis).dump(indent);
}

ProcessDocument import_process(const json& j) {
    require_object(j, "document");

    process_model::ProcessInfo info;
    if (const json* p = member(j, "process")) {
        require_object(*p, "process");
        info.id = optional_string(*p, "id", "process");
        info.name = optional_string(*p, "name", "process");
    }

    const json& node_arr = required_array(j, "nodes");
    const json& edge_arr = required_array(j, "edges");
    std::vector<process_model::Node> nodes;
    nodes.reserve(node_arr.size());
    for (std::size_t i = 0; i < node_arr.size(); ++i)
        nodes.push_back(parse_node(node_arr[i], i));
    std::vector<process_model::Edge> edges;
    edges.reserve(edge_arr.size());
    for (std::size_t i = 0; i < edge_arr.size(); ++i)
        edges.push_back(parse_edge(edge_arr[i], i));

    ProcessDocument doc;
    doc.graph = process_model::ProcessGraph::build(std::move(info), std::move(nodes), std::move(edges));

    if (member(j, "layout"))
        doc.analysis.layout = parse_layout(required_array(j, "layout"), doc.graph);
    if (member(j, "paths")) {
        const json& arr = required_array(j, "paths");
        std::vector<process_model::Path> paths;
        for (std::size_t i = 0; i < arr.size(); ++i)
            paths.push_back(parse_path(arr[i], doc.graph, "paths[" + std::to_string(i) + "]"));
        doc.analysis.paths = std::move(paths);
    }
    if (member(j, "bottlenecks"))
        doc.analysis.bottlenecks = parse_bottlenecks(required_array(j, "bottlenecks"), doc.graph);
    if (const json* c = member(j, "criticalPath"))
        doc.analysis.critical_path = parse_critical_path(*c, doc.graph);
    return doc;
}

std::optional<ProcessDocument> load_process_from_json(std::istream& in) {
    auto log = process_model::engine_logger();
    try {
        const json j = json::parse(in);
        return import_process(j);
    } catch (const json::exception& e) {
        log->error("process document is not valid JSON: {}", e.what());
    } catch (const process_model::ValidationError& e) {
        log->error("process document rejected: {}", e.what());
    }
    return std::nullopt;
}

} // namespace process_export
