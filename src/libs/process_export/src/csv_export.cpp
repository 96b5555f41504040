#include <process_export/csv_export.hpp>
#include <spdlog/fmt/fmt.h>
#include <sstream>

namespace process_export {

namespace {

// RFC 4180: quote cells holding a separator, a quote or a line break.
std::string csv_cell(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
    std::string out = "\"";
    for (const char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// Shortest text that reads back to the same double.
std::string number_cell(const std::optional<double>& v) {
    if (!v) return "";
    return fmt::format("{}", *v);
}

} // namespace

std::string export_nodes_csv(const process_model::ProcessGraph& graph) {
    std::ostringstream os;
    os << "id,label,kind,duration,cost,role\n";
    for (const auto& n : graph.nodes()) {
        os << csv_cell(n.id) << ','
           << csv_cell(n.label) << ','
           << process_model::to_string(n.kind) << ','
           << number_cell(n.attributes.duration) << ','
           << number_cell(n.attributes.cost) << ','
           << csv_cell(n.attributes.role.value_or("")) << '\n';
    }
    return os.str();
}

std::string export_edges_csv(const process_model::ProcessGraph& graph) {
    std::ostringstream os;
    os << "from,to,label\n";
    for (const auto& e : graph.edges())
        os << csv_cell(e.from) << ',' << csv_cell(e.to) << ',' << csv_cell(e.label) << '\n';
    return os.str();
}

} // namespace process_export
