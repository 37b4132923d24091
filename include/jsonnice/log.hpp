#pragma once

#include <string>
#include <type_traits>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include "error.hpp"

namespace jsonnice {

// =============================================================================
// Log level enum
// =============================================================================

enum class log_level {
    debug,
    info,
    warn,
    error
};

inline auto to_string(log_level level) -> const char* {
    switch (level) {
        case log_level::debug: return "debug";
        case log_level::info: return "info";
        case log_level::warn: return "warn";
        case log_level::error: return "error";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<log_level>, const std::string& s) -> log_level {
    if (s == "debug") return log_level::debug;
    if (s == "info") return log_level::info;
    if (s == "warn") return log_level::warn;
    if (s == "error") return log_level::error;
    throw config_error("invalid log level " + s + ". Allowed: debug,info,warn,error");
}

namespace log {

inline auto to_spdlog(log_level level) -> spdlog::level::level_enum {
    switch (level) {
        case log_level::debug: return spdlog::level::debug;
        case log_level::info: return spdlog::level::info;
        case log_level::warn: return spdlog::level::warn;
        case log_level::error: return spdlog::level::err;
    }
    return spdlog::level::err;
}

/// Install a colored stderr logger as the spdlog default. Safe to call again
/// to change the level.
inline void setup(log_level level) {
    auto logger = spdlog::get("jsonnice");
    if (!logger) {
        logger = spdlog::stderr_color_mt("jsonnice");
        logger->set_pattern("%H:%M:%S.%e %^%-5l%$ %v");
    }
    logger->set_level(to_spdlog(level));
    spdlog::set_default_logger(logger);
}

} // namespace log

} // namespace jsonnice
