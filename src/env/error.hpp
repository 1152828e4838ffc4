#pragma once
#include <cstddef>
#include <string>

namespace librarian::env {

enum class LoadErrorReason {
    MISSING,     // Source file does not exist
    UNREADABLE,  // Source exists but cannot be opened or read
    MALFORMED,   // A line is not a valid assignment
    INVALID,     // Values fail schema validation or profile lookup
    ENVIRONMENT  // Writing the process environment failed
};

std::string load_error_reason_to_string(LoadErrorReason reason);

// The single failure class of configuration loading
struct ConfigLoadError {
    LoadErrorReason reason = LoadErrorReason::MALFORMED;
    std::string source;  // File path, or "<builtin>"
    size_t line = 0;     // 0 = not tied to a line
    std::string message;

    // "source:line: message" (line omitted when 0)
    std::string to_string() const;
};

ConfigLoadError make_load_error(LoadErrorReason reason, const std::string& source,
                                const std::string& message, size_t line = 0);

} // namespace librarian::env
