#include "core/paths.hpp"
#include <system_error>
#include <unistd.h>
#include <limits.h>

namespace librarian::core::paths {

std::filesystem::path executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

std::filesystem::path executable_dir() {
    auto exe = executable_path();
    if (exe.empty()) {
        return {};
    }
    return exe.parent_path();
}

std::vector<std::filesystem::path> project_search_paths(const std::filesystem::path& start) {
    std::vector<std::filesystem::path> roots;
    if (!start.empty()) {
        roots.push_back(start);
        roots.push_back(start.parent_path());
        roots.push_back(start.parent_path().parent_path());
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        roots.push_back(exe_dir);
        roots.push_back(exe_dir.parent_path());
        roots.push_back(exe_dir.parent_path().parent_path());
    }

    // De-duplicate while preserving order.
    std::vector<std::filesystem::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        bool seen = false;
        for (const auto& u : unique) {
            if (u == p) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            unique.push_back(p);
        }
    }
    return unique;
}

std::vector<std::filesystem::path> project_search_paths() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd.clear();
    }
    return project_search_paths(cwd);
}

std::optional<std::filesystem::path> find_first(const std::vector<std::filesystem::path>& roots,
                                                const std::vector<std::string>& relatives) {
    for (const auto& base : roots) {
        for (const auto& relative : relatives) {
            auto candidate = base / relative;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                auto canonical = std::filesystem::canonical(candidate, ec);
                return ec ? candidate : canonical;
            }
        }
    }
    return std::nullopt;
}

} // namespace librarian::core::paths
