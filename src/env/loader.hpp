/**
 * Environment loader
 *
 * Resolves the librarian configuration (source file or built-in table,
 * profile, override file, explicit overrides), validates it, and writes it
 * into an Environment in one step: either every variable is written or
 * none is.
 */
#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "env/entry.hpp"
#include "env/environment.hpp"
#include "env/error.hpp"

namespace librarian::env {

struct LoadOptions {
    // Explicit source; must be readable. Without it the default names are
    // searched for and the built-in table is used if none is found.
    std::optional<std::filesystem::path> env_file;

    // Roots searched for the default names; nullopt = project search paths
    std::optional<std::vector<std::filesystem::path>> search_roots;

    std::string profile = "production";

    // Env file whose active entries are applied as overrides
    std::optional<std::filesystem::path> override_file;

    // Highest precedence
    EnvMap overrides;

    // Keep values that were in the environment before the loader wrote them
    bool respect_existing = true;

    // Also export GOOGLE_CLOUD_PROJECT and the other agent framework variables
    bool include_derived = false;
};

struct LoadResult {
    bool success = false;
    std::optional<ConfigLoadError> error;
    EnvMap values;       // Mapping in effect
    std::string source;  // Path of the source, or "<builtin>"
};

class EnvLoader {
public:
    // Loads into the process environment
    EnvLoader();
    explicit EnvLoader(Environment& environment);
    ~EnvLoader();

    // Non-copyable
    EnvLoader(const EnvLoader&) = delete;
    EnvLoader& operator=(const EnvLoader&) = delete;

    // File names searched for under each root, in order
    static const std::vector<std::string>& default_source_names();

    // Resolve and validate without touching the environment
    LoadResult resolve(const LoadOptions& options) const;

    // Resolve, validate, then write into the environment
    LoadResult load(const LoadOptions& options);

    // Restore every variable written by load() to its earlier state
    bool unload();

    // Names this loader has written and not yet restored
    std::vector<std::string> managed_names() const;

private:
    std::unique_ptr<Environment> owned_environment_;
    Environment* environment_;

    // Value before the first write, per managed name (nullopt = was unset)
    std::map<std::string, std::optional<std::string>> prior_values_;

    bool restore(const std::string& name, const std::optional<std::string>& value);
};

} // namespace librarian::env
