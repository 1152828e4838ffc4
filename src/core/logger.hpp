#pragma once
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace librarian::core {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name. Accepts the Python logging names (DEBUG, INFO,
// WARNING, ERROR, CRITICAL) as well as spdlog's own, in any case.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

// Python-style name for a level ("WARNING" rather than "warning").
std::string log_level_name(spdlog::level::level_enum level);

} // namespace librarian::core
