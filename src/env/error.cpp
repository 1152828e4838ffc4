#include "env/error.hpp"

namespace librarian::env {

std::string load_error_reason_to_string(LoadErrorReason reason) {
    switch (reason) {
        case LoadErrorReason::MISSING:     return "missing";
        case LoadErrorReason::UNREADABLE:  return "unreadable";
        case LoadErrorReason::MALFORMED:   return "malformed";
        case LoadErrorReason::INVALID:     return "invalid";
        case LoadErrorReason::ENVIRONMENT: return "environment";
        default: return "unknown";
    }
}

std::string ConfigLoadError::to_string() const {
    std::string out = source.empty() ? std::string("<unknown>") : source;
    if (line > 0) {
        out += ":" + std::to_string(line);
    }
    out += ": " + message + " (" + load_error_reason_to_string(reason) + ")";
    return out;
}

ConfigLoadError make_load_error(LoadErrorReason reason, const std::string& source,
                                const std::string& message, size_t line) {
    ConfigLoadError error;
    error.reason = reason;
    error.source = source;
    error.line = line;
    error.message = message;
    return error;
}

} // namespace librarian::env
