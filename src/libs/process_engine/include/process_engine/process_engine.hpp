#pragma once

#include <process_analysis/types.hpp>
#include <process_engine/engine_config.hpp>
#include <process_export/json_document.hpp>
#include <process_layout/types.hpp>
#include <process_model/graph.hpp>
#include <process_model/graph_provider.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace process_engine {

struct AnalysisReport {
    process_model::ProcessGraph graph;
    process_layout::LayoutResult layout;
    std::vector<process_layout::FlowLine> flow_lines;
    process_analysis::PathSet paths;
    std::vector<process_analysis::Bottleneck> bottlenecks;
    // Empty when the process has no start->end path, or when the length limit
    // stopped every search before one was found.
    std::optional<process_analysis::CriticalPath> critical_path;
    process_analysis::ProcessStatistics statistics;
    std::vector<process_analysis::BranchPoint> branch_points;
    // Non-fatal findings (degenerate layout, truncated search, missing path, dead ends).
    std::vector<std::string> warnings;

    process_export::AnalysisSections sections() const;
};

// Fetches a process from the provider and runs every analysis on it. Holds
// no per-call state, so concurrent analyze() calls are safe as long as the
// provider is.
class ProcessEngine {
public:
    explicit ProcessEngine(const process_model::GraphProvider& provider, EngineConfig config = {});

    const EngineConfig& config() const { return config_; }

    // NotFoundError from the provider propagates unchanged.
    AnalysisReport analyze(const std::string& process_id) const;
    AnalysisReport analyze(process_model::ProcessGraph graph) const;

    // Graph plus layout, paths, bottlenecks and critical path.
    nlohmann::json export_document(const std::string& process_id) const;

private:
    const process_model::GraphProvider& provider_;
    EngineConfig config_;
};

} // namespace process_engine
