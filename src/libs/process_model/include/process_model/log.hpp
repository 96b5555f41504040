#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace process_model {

// Shared "process_flow" logger used by every library. Falls back to the spdlog
// default logger when the named logger cannot be created.
std::shared_ptr<spdlog::logger> engine_logger();

} // namespace process_model
