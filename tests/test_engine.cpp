#include <gtest/gtest.h>
#include <process_engine/engine_config.hpp>
#include <process_engine/process_engine.hpp>
#include <process_export/sample_process.hpp>
#include <process_model/errors.hpp>
#include <process_model/graph_provider.hpp>
#include <process_model/log.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include "test_helpers.hpp"
#include <algorithm>
#include <sstream>

using namespace process_engine;
using nlohmann::json;
using process_analysis::WeightMetric;
using process_model::NodeKind;
using process_model::ValidationError;
using test_helpers::make_graph;
using test_helpers::node;

namespace {

process_model::InMemoryGraphProvider sample_provider() {
    process_model::InMemoryGraphProvider provider;
    provider.add(process_export::make_sample_process());
    return provider;
}

bool mentions(const std::vector<std::string>& warnings, const std::string& text) {
    return std::any_of(warnings.begin(), warnings.end(),
        [&](const std::string& w) { return w.find(text) != std::string::npos; });
}

// Captures everything the shared logger writes while in scope.
class CapturedLog {
public:
    CapturedLog() : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)) {
        process_model::engine_logger()->sinks().push_back(sink_);
    }
    ~CapturedLog() {
        auto& sinks = process_model::engine_logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
    }

    std::size_t count(const std::string& text) const {
        const auto lines = sink_->last_formatted();
        return static_cast<std::size_t>(std::count_if(lines.begin(), lines.end(),
            [&](const std::string& line) { return line.find(text) != std::string::npos; }));
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

} // namespace

// ─── Analysis ─────────────────────────────────────────────────

TEST(ProcessEngineTest, AnalyzeSampleProcess) {
    const auto provider = sample_provider();
    const ProcessEngine engine(provider);
    const auto report = engine.analyze("order-handling");
    EXPECT_EQ(report.graph.info().id, "order-handling");
    EXPECT_EQ(report.layout.positions.size(), 12u);
    EXPECT_EQ(report.flow_lines.size(), 13u);
    EXPECT_EQ(report.paths.paths.size(), 3u);
    ASSERT_EQ(report.bottlenecks.size(), 2u);
    ASSERT_TRUE(report.critical_path.has_value());
    EXPECT_DOUBLE_EQ(report.critical_path->weight, 120.0);
    EXPECT_EQ(report.statistics.task_count, 7u);
    ASSERT_EQ(report.branch_points.size(), 1u);
    EXPECT_TRUE(report.warnings.empty());
}

TEST(ProcessEngineTest, UnknownProcessIsNotFound) {
    const auto provider = sample_provider();
    const ProcessEngine engine(provider);
    EXPECT_THROW(engine.analyze("missing"), process_model::NotFoundError);
    EXPECT_THROW(engine.export_document("missing"), process_model::NotFoundError);
}

TEST(ProcessEngineTest, MissingPathIsAWarningNotAFailure) {
    const auto provider = sample_provider();
    const ProcessEngine engine(provider);
    const auto g = make_graph(
        { node("Start", NodeKind::Start), node("A", NodeKind::Task), node("B", NodeKind::Task),
          node("End", NodeKind::End), node("Lost", NodeKind::Task) },
        { {"Start", "A"}, {"A", "B"}, {"B", "A"} });
    const auto report = engine.analyze(g);
    EXPECT_FALSE(report.critical_path.has_value());
    EXPECT_TRUE(report.paths.paths.empty());
    EXPECT_TRUE(mentions(report.warnings, "Lost"));
    EXPECT_TRUE(mentions(report.warnings, "dead end"));
    EXPECT_EQ(report.bottlenecks.size(), 1u);
}

TEST(ProcessEngineTest, ConfigDrivesMetricAndLimit) {
    const auto provider = sample_provider();
    EngineConfig config;
    config.metric = WeightMetric::Cost;
    config.paths.max_path_length = 3;
    const ProcessEngine engine(provider, config);
    const auto report = engine.analyze("order-handling");
    EXPECT_TRUE(report.paths.limit_exceeded);
    EXPECT_TRUE(report.paths.paths.empty());
    EXPECT_FALSE(report.critical_path.has_value());
    EXPECT_TRUE(mentions(report.warnings, "length limit"));
}

TEST(ProcessEngineTest, LengthLimitIsNotReportedAsMissingPath) {
    process_model::InMemoryGraphProvider provider;
    provider.add(test_helpers::linear_graph());
    EngineConfig config;
    config.paths.max_path_length = 3;
    const ProcessEngine engine(provider, config);
    const auto report = engine.analyze("linear");
    EXPECT_FALSE(report.critical_path.has_value());
    EXPECT_TRUE(mentions(report.warnings, "length limit"));
    EXPECT_FALSE(mentions(report.warnings, "no start-to-end path"));
}

TEST(ProcessEngineTest, FindingsAreLoggedOnce) {
    process_model::InMemoryGraphProvider provider;
    provider.add(test_helpers::linear_graph());
    EngineConfig config;
    config.paths.max_path_length = 3;
    const ProcessEngine engine(provider, config);

    const CapturedLog captured;
    const auto truncated = engine.analyze("linear");
    EXPECT_TRUE(truncated.paths.limit_exceeded);
    EXPECT_EQ(captured.count("path search exceeded"), 1u);
    EXPECT_EQ(captured.count("no start-to-end path"), 0u);

    const auto no_path = ProcessEngine(provider).analyze(make_graph(
        { node("Start", NodeKind::Start), node("A", NodeKind::Task), node("End", NodeKind::End) },
        { {"Start", "A"}, {"A", "Start"} }, "stuck"));
    EXPECT_FALSE(no_path.critical_path.has_value());
    EXPECT_EQ(captured.count("no start-to-end path in process 'stuck'"), 1u);
}

TEST(ProcessEngineTest, CostMetricFromConfig) {
    const auto provider = sample_provider();
    const ProcessEngine engine(provider, load_engine_config(json{ {"weight", "cost"} }));
    const auto report = engine.analyze("order-handling");
    ASSERT_TRUE(report.critical_path.has_value());
    EXPECT_EQ(report.critical_path->metric, WeightMetric::Cost);
    EXPECT_DOUBLE_EQ(report.critical_path->weight, 80.0);
}

TEST(ProcessEngineTest, ExportDocumentHasAllSections) {
    const auto provider = sample_provider();
    const ProcessEngine engine(provider);
    const json doc = engine.export_document("order-handling");
    EXPECT_TRUE(doc.contains("process"));
    EXPECT_EQ(doc["nodes"].size(), 12u);
    EXPECT_EQ(doc["edges"].size(), 13u);
    EXPECT_EQ(doc["layout"].size(), 12u);
    EXPECT_EQ(doc["paths"].size(), 3u);
    EXPECT_EQ(doc["bottlenecks"].size(), 2u);
    EXPECT_EQ(doc["criticalPath"]["metric"], "duration");
}

// ─── Configuration ────────────────────────────────────────────

TEST(EngineConfigTest, DefaultsWhenEmpty) {
    const auto config = load_engine_config(json::object());
    EXPECT_DOUBLE_EQ(config.layout.node_spacing_x, process_layout::layout::node_spacing_x);
    EXPECT_DOUBLE_EQ(config.layout.layer_spacing_y, process_layout::layout::layer_spacing_y);
    EXPECT_EQ(config.paths.start_kind, NodeKind::Start);
    EXPECT_FALSE(config.paths.max_path_length.has_value());
    EXPECT_EQ(config.metric, WeightMetric::Duration);
}

TEST(EngineConfigTest, RecognisedKeysOverrideBase) {
    const json j = {
        {"nodeSpacingX", 200},
        {"layerSpacingY", 80.5},
        {"originX", -10},
        {"maxPathLength", 6},
        {"startKind", "Event"},
        {"endKind", "Decision"},
        {"weight", "cost"},
        {"ignored", true},
    };
    const auto config = load_engine_config(j);
    EXPECT_DOUBLE_EQ(config.layout.node_spacing_x, 200.0);
    EXPECT_DOUBLE_EQ(config.layout.layer_spacing_y, 80.5);
    EXPECT_DOUBLE_EQ(config.layout.origin_x, -10.0);
    ASSERT_TRUE(config.paths.max_path_length.has_value());
    EXPECT_EQ(*config.paths.max_path_length, 6u);
    EXPECT_EQ(config.paths.start_kind, NodeKind::Event);
    EXPECT_EQ(config.paths.end_kind, NodeKind::Gateway);
    EXPECT_EQ(config.metric, WeightMetric::Cost);
}

TEST(EngineConfigTest, NullLimitResetsBase) {
    EngineConfig base;
    base.paths.max_path_length = 4;
    const auto config = load_engine_config(json{ {"maxPathLength", nullptr} }, base);
    EXPECT_FALSE(config.paths.max_path_length.has_value());
}

TEST(EngineConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(load_engine_config(json{ {"nodeSpacingX", 0} }), ValidationError);
    EXPECT_THROW(load_engine_config(json{ {"layerSpacingY", "wide"} }), ValidationError);
    EXPECT_THROW(load_engine_config(json{ {"maxPathLength", -1} }), ValidationError);
    EXPECT_THROW(load_engine_config(json{ {"maxPathLength", 2.5} }), ValidationError);
    EXPECT_THROW(load_engine_config(json{ {"startKind", "Begin"} }), ValidationError);
    EXPECT_THROW(load_engine_config(json{ {"weight", "time"} }), ValidationError);
    EXPECT_THROW(load_engine_config(json::array()), ValidationError);
}

TEST(EngineConfigTest, StreamWithBadJsonIsAValidationError) {
    std::istringstream broken("{ nodeSpacingX: 1 }");
    EXPECT_THROW(load_engine_config(broken), ValidationError);

    std::istringstream good(R"({"layerSpacingY": 150})");
    EXPECT_DOUBLE_EQ(load_engine_config(good).layout.layer_spacing_y, 150.0);
}
