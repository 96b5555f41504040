#pragma once

#include <process_analysis/types.hpp>
#include <process_layout/types.hpp>
#include <nlohmann/json.hpp>
#include <istream>

namespace process_engine {

struct EngineConfig {
    process_layout::LayoutConfig layout;
    process_analysis::PathOptions paths;
    process_analysis::WeightMetric metric = process_analysis::WeightMetric::Duration;
};

// Overlays the recognised keys of j onto base: nodeSpacingX, layerSpacingY,
// originX, originY, maxPathLength, startKind, endKind, weight. Unknown keys
// are ignored; wrong types or out-of-range values throw ValidationError.
EngineConfig load_engine_config(const nlohmann::json& j, EngineConfig base = {});
// Throws ValidationError when the stream is not valid JSON.
EngineConfig load_engine_config(std::istream& in, EngineConfig base = {});

} // namespace process_engine
