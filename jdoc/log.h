#pragma once

#include <memory>
#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace jdoc {

constexpr const char* logger_name = "jdoc";

/**
 * Return the library logger.
 *
 * An application that wants jdoc output in its own sinks registers a logger
 * named "jdoc" before the first call; otherwise a stderr logger is created
 * on demand.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto log = spdlog::get(logger_name);
    if (!log) {
        log = spdlog::stderr_color_mt(logger_name);
        log->set_level(spdlog::level::warn);
    }
    return log;
}

inline void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace jdoc
