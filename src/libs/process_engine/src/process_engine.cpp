#include <process_engine/process_engine.hpp>
#include <process_analysis/bottleneck_analyzer.hpp>
#include <process_analysis/critical_path.hpp>
#include <process_analysis/path_enumerator.hpp>
#include <process_analysis/process_statistics.hpp>
#include <process_layout/flow_lines.hpp>
#include <process_layout/layered_layout.hpp>
#include <process_model/errors.hpp>
#include <process_model/log.hpp>
#include <utility>

namespace process_engine {

process_export::AnalysisSections AnalysisReport::sections() const {
    process_export::AnalysisSections s;
    s.layout = layout;
    s.paths = paths.paths;
    s.bottlenecks = bottlenecks;
    s.critical_path = critical_path;
    return s;
}

ProcessEngine::ProcessEngine(const process_model::GraphProvider& provider, EngineConfig config)
    : provider_(provider), config_(std::move(config)) {}

AnalysisReport ProcessEngine::analyze(const std::string& process_id) const {
    return analyze(provider_.fetch_graph(process_id));
}

AnalysisReport ProcessEngine::analyze(process_model::ProcessGraph graph) const {
    auto log = process_model::engine_logger();
    AnalysisReport report;
    report.graph = std::move(graph);
    const auto& g = report.graph;

    report.layout = process_layout::layout_process_graph(g, config_.layout);
    report.flow_lines = process_layout::compute_flow_lines(g, report.layout, config_.layout);
    if (report.layout.degenerate)
        report.warnings.push_back("no source node; layout rooted at '" + report.layout.roots.front() + "'");
    for (const auto& id : report.layout.isolated)
        report.warnings.push_back("node '" + id + "' is unreachable from every root");

    report.paths = process_analysis::enumerate_paths(g, config_.paths);
    for (const auto& start_id : report.paths.truncated)
        report.warnings.push_back("path search from '" + start_id + "' exceeded the length limit");

    report.bottlenecks = process_analysis::find_bottlenecks(g);
    report.branch_points = process_analysis::find_branch_points(g);
    report.statistics = process_analysis::compute_statistics(g);
    for (const auto& id : report.statistics.dead_ends)
        report.warnings.push_back("node '" + id + "' is a dead end");

    try {
        auto critical = process_analysis::select_critical_path(g, report.paths, config_.metric);
        if (!critical.nodes.empty())
            report.critical_path = std::move(critical);
        else
            report.warnings.push_back("critical path unavailable: the length limit stopped the search before any path was found");
    } catch (const process_model::NoPathError& e) {
        log->warn("{}", e.what());
        report.warnings.push_back(e.what());
    }

    log->info("process '{}': {} nodes, {} edges, {} path(s), {} bottleneck(s), {} warning(s)",
        g.info().id, g.node_count(), g.edge_count(), report.paths.paths.size(),
        report.bottlenecks.size(), report.warnings.size());
    return report;
}

nlohmann::json ProcessEngine::export_document(const std::string& process_id) const {
    const AnalysisReport report = analyze(process_id);
    return process_export::export_process(report.graph, report.sections());
}

} // namespace process_engine
