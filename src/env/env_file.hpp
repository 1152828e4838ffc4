/**
 * Shell-style env files
 *
 * Reads the same files a shell would `source`:
 *
 *   ## agent
 *   # export PLANNING_AGENT_MODEL=gemini-2.5-flash   <- defined, inactive
 *   export ENTITY_MANAGER_MODEL=gemini-2.5-flash     <- active
 *
 * and writes resolved mappings back out as shell or dotenv text.
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "env/entry.hpp"
#include "env/error.hpp"

namespace librarian::env {

struct ParseResult {
    bool success = false;
    std::vector<Entry> entries;
    std::optional<ConfigLoadError> error;
};

// Parse env file text. `source` names the text in error messages.
ParseResult parse_env_text(const std::string& text, const std::string& source);

// Read and parse a file. Fails with MISSING or UNREADABLE before parsing.
ParseResult read_env_file(const std::filesystem::path& path);

// Single-quote a value for POSIX shells
std::string shell_quote(const std::string& value);

// export NAME='VALUE' lines, one per entry
std::string format_shell(const EnvMap& values);

// NAME=VALUE lines, quoted only where needed
std::string format_dotenv(const EnvMap& values);

} // namespace librarian::env
