// Process graph analyzer: layout, paths, bottlenecks and critical path (C++20)
#include <process_engine/engine_config.hpp>
#include <process_engine/process_engine.hpp>
#include <process_export/csv_export.hpp>
#include <process_export/json_document.hpp>
#include <process_export/sample_process.hpp>
#include <process_analysis/critical_path.hpp>
#include <process_model/errors.hpp>
#include <process_model/graph_provider.hpp>
#include <process_model/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string input_path;
    std::string config_path;
    std::string output_path;
    std::string csv_prefix;
    std::string log_file;
    std::optional<process_analysis::WeightMetric> metric;
    std::optional<std::size_t> max_path_length;
    bool verbose = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: process_flow [document.json] [--config FILE] [--metric duration|cost]\n"
        "                    [--max-path-length N] [--output FILE] [--csv PREFIX]\n"
        "                    [--log-file FILE] [--verbose]\n");
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        std::string v;
        if (arg == "--config") {
            if (!value(opts.config_path)) return false;
        } else if (arg == "--output") {
            if (!value(opts.output_path)) return false;
        } else if (arg == "--csv") {
            if (!value(opts.csv_prefix)) return false;
        } else if (arg == "--log-file") {
            if (!value(opts.log_file)) return false;
        } else if (arg == "--metric") {
            if (!value(v)) return false;
            opts.metric = process_analysis::metric_from_string(v);
            if (!opts.metric) return false;
        } else if (arg == "--max-path-length") {
            if (!value(v)) return false;
            try {
                const long long n = std::stoll(v);
                if (n < 0) return false;
                opts.max_path_length = static_cast<std::size_t>(n);
            } catch (const std::exception&) {
                return false;
            }
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] != '-' && opts.input_path.empty()) {
            opts.input_path = arg;
        } else {
            return false;
        }
    }
    return true;
}

// Console logger, plus a file sink when requested. Registered under the name
// the libraries look up, so every component logs through it.
void setup_logging(const Options& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!opts.log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.log_file, true);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            (void)fprintf(stderr, "cannot open log file %s: %s\n", opts.log_file.c_str(), e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("process_flow", sinks.begin(), sinks.end());
    logger->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

bool write_text(const std::string& path, const std::string& text) {
    std::ofstream f(path);
    if (!f) return false;
    f << text;
    return static_cast<bool>(f);
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 1;
    }
    setup_logging(opts);
    auto log = process_model::engine_logger();

    process_engine::EngineConfig config;
    if (!opts.config_path.empty()) {
        std::ifstream f(opts.config_path);
        if (!f) {
            log->error("cannot open config file {}", opts.config_path);
            return 1;
        }
        try {
            config = process_engine::load_engine_config(f);
        } catch (const process_model::ValidationError& e) {
            log->error("{}: {}", opts.config_path, e.what());
            return 1;
        }
    }
    if (opts.metric) config.metric = *opts.metric;
    if (opts.max_path_length) config.paths.max_path_length = opts.max_path_length;

    process_model::InMemoryGraphProvider provider;
    std::string process_id;
    if (opts.input_path.empty()) {
        log->info("no input document given; using the sample process");
        auto sample = process_export::make_sample_process();
        process_id = sample.info().id;
        provider.add(std::move(sample));
    } else {
        std::ifstream f(opts.input_path);
        if (!f) {
            log->error("cannot open {}", opts.input_path);
            return 1;
        }
        auto doc = process_export::load_process_from_json(f);
        if (!doc) return 1;
        process_id = doc->graph.info().id;
        provider.add(std::move(doc->graph));
    }

    const process_engine::ProcessEngine engine(provider, config);
    process_engine::AnalysisReport report;
    try {
        report = engine.analyze(process_id);
    } catch (const process_model::NotFoundError& e) {
        log->error("{}", e.what());
        return 2;
    }

    // Each finding in report.warnings was already logged where it was detected.
    if (report.critical_path) {
        const auto& cp = *report.critical_path;
        log->info("critical path by {}: {} node(s), weight {}",
            process_analysis::to_string(cp.metric), cp.nodes.size(), cp.weight);
    }
    for (const auto& b : report.bottlenecks)
        log->info("convergence at '{}' ({} branches)", b.node_id, b.distinct_predecessor_count);

    if (!opts.csv_prefix.empty()) {
        const std::string nodes_path = opts.csv_prefix + "_nodes.csv";
        const std::string edges_path = opts.csv_prefix + "_edges.csv";
        if (!write_text(nodes_path, process_export::export_nodes_csv(report.graph))
            || !write_text(edges_path, process_export::export_edges_csv(report.graph))) {
            log->error("cannot write CSV files with prefix {}", opts.csv_prefix);
            return 1;
        }
    }

    const std::string document = process_export::export_process_to_string(report.graph, report.sections());
    if (opts.output_path.empty()) {
        std::cout << document << '\n';
    } else if (!write_text(opts.output_path, document + "\n")) {
        log->error("cannot write {}", opts.output_path);
        return 1;
    } else {
        log->info("exported process '{}' to {}", process_id, opts.output_path);
    }
    return 0;
}
