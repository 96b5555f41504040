#include <process_engine/engine_config.hpp>
#include <process_analysis/critical_path.hpp>
#include <process_model/errors.hpp>
#include <cmath>
#include <string>

namespace process_engine {

namespace {

using nlohmann::json;
using process_model::ValidationError;

void read_spacing(const json& j, const char* key, double& out) {
    const auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number() || !std::isfinite(it->get<double>()) || it->get<double>() <= 0.0)
        throw ValidationError(std::string("config: '") + key + "' must be a positive number");
    out = it->get<double>();
}

void read_origin(const json& j, const char* key, double& out) {
    const auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number() || !std::isfinite(it->get<double>()))
        throw ValidationError(std::string("config: '") + key + "' must be a number");
    out = it->get<double>();
}

void read_kind(const json& j, const char* key, process_model::NodeKind& out) {
    const auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string()) throw ValidationError(std::string("config: '") + key + "' must be a string");
    const auto kind = process_model::kind_from_string(it->get<std::string>());
    if (!kind) throw ValidationError(std::string("config: unknown node kind for '") + key + "'");
    out = *kind;
}

} // namespace

EngineConfig load_engine_config(const json& j, EngineConfig base) {
    if (!j.is_object()) throw ValidationError("config: expected a JSON object");

    read_spacing(j, "nodeSpacingX", base.layout.node_spacing_x);
    read_spacing(j, "layerSpacingY", base.layout.layer_spacing_y);
    read_origin(j, "originX", base.layout.origin_x);
    read_origin(j, "originY", base.layout.origin_y);
    read_kind(j, "startKind", base.paths.start_kind);
    read_kind(j, "endKind", base.paths.end_kind);

    if (const auto it = j.find("maxPathLength"); it != j.end()) {
        if (it->is_null()) {
            base.paths.max_path_length.reset();
        } else if (it->is_number_integer() && it->get<long long>() >= 0) {
            base.paths.max_path_length = static_cast<std::size_t>(it->get<long long>());
        } else {
            throw ValidationError("config: 'maxPathLength' must be a non-negative integer or null");
        }
    }

    if (const auto it = j.find("weight"); it != j.end()) {
        const auto metric = it->is_string()
            ? process_analysis::metric_from_string(it->get<std::string>())
            : std::nullopt;
        if (!metric) throw ValidationError("config: 'weight' must be \"duration\" or \"cost\"");
        base.metric = *metric;
    }
    return base;
}

EngineConfig load_engine_config(std::istream& in, EngineConfig base) {
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("config: ") + e.what());
    }
    return load_engine_config(j, std::move(base));
}

} // namespace process_engine
