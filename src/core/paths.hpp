#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace librarian::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Search roots for project-relative files: start, its parent and
// grandparent, then the same three levels above the executable.
std::vector<std::filesystem::path> project_search_paths(const std::filesystem::path& start);

// Same, starting from the current working directory.
std::vector<std::filesystem::path> project_search_paths();

// First existing regular file among the relative candidates. Candidates are
// tried in order under each root before moving to the next root.
std::optional<std::filesystem::path> find_first(const std::vector<std::filesystem::path>& roots,
                                                const std::vector<std::string>& relatives);

} // namespace librarian::core::paths
