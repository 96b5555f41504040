#pragma once

#include <process_analysis/types.hpp>
#include <process_layout/types.hpp>
#include <process_model/graph.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace process_export {

// Analysis results that may accompany a graph in an exported document. Each
// section is written only when present.
struct AnalysisSections {
    std::optional<process_layout::LayoutResult> layout;
    std::optional<std::vector<process_model::Path>> paths;
    std::optional<std::vector<process_analysis::Bottleneck>> bottlenecks;
    std::optional<process_analysis::CriticalPath> critical_path;
};

struct ProcessDocument {
    process_model::ProcessGraph graph;
    AnalysisSections analysis;
};

nlohmann::json export_process(const process_model::ProcessGraph& graph, const AnalysisSections& analysis = {});
std::string export_process_to_string(const process_model::ProcessGraph& graph,
    const AnalysisSections& analysis = {},
    int indent = 2);

// Rebuilds the graph (and any analysis sections) from an exported document.
// Throws ValidationError for a malformed document or an invalid graph.
ProcessDocument import_process(const nlohmann::json& j);

// Parses and imports; parse and validation failures are logged and yield nullopt.
std::optional<ProcessDocument> load_process_from_json(std::istream& in);

} // namespace process_export
