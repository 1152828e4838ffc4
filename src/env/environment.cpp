#include "env/environment.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <spdlog/spdlog.h>

namespace librarian::env {

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

bool ProcessEnvironment::set(const std::string& name, const std::string& value) {
    if (setenv(name.c_str(), value.c_str(), 1) != 0) {
        spdlog::error("setenv({}) failed: {}", name, std::strerror(errno));
        return false;
    }
    return true;
}

bool ProcessEnvironment::unset(const std::string& name) {
    if (unsetenv(name.c_str()) != 0) {
        spdlog::error("unsetenv({}) failed: {}", name, std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace librarian::env
