#include <process_model/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace process_model {

namespace {

const char* const logger_name = "process_flow";

} // namespace

std::shared_ptr<spdlog::logger> engine_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    if (logger) return logger;

    // The CLI may have registered its own logger under the same name.
    logger = spdlog::get(logger_name);
    if (logger) return logger;

    try {
        logger = spdlog::stderr_color_mt(logger_name);
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace process_model
