#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace librarian::core {

void init_logger() {
    auto logger = spdlog::get("librarian");
    if (!logger) {
        logger = spdlog::stderr_color_mt("librarian");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l][pid:%P] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return spdlog::level::trace;
    if (upper == "DEBUG") return spdlog::level::debug;
    if (upper == "INFO") return spdlog::level::info;
    if (upper == "WARNING" || upper == "WARN") return spdlog::level::warn;
    if (upper == "ERROR" || upper == "ERR") return spdlog::level::err;
    if (upper == "CRITICAL" || upper == "FATAL") return spdlog::level::critical;
    if (upper == "OFF") return spdlog::level::off;
    return std::nullopt;
}

std::string log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return "TRACE";
        case spdlog::level::debug:    return "DEBUG";
        case spdlog::level::info:     return "INFO";
        case spdlog::level::warn:     return "WARNING";
        case spdlog::level::err:      return "ERROR";
        case spdlog::level::critical: return "CRITICAL";
        default: return "OFF";
    }
}

} // namespace librarian::core
