#include "env/loader.hpp"
#include "core/paths.hpp"
#include "env/env_file.hpp"
#include "env/profile.hpp"
#include "env/schema.hpp"
#include "env/settings.hpp"
#include <set>
#include <utility>
#include <spdlog/spdlog.h>

namespace librarian::env {

namespace {

const std::string kBuiltinSource = "<builtin>";

std::string describe(const std::vector<Violation>& violations) {
    std::string message;
    for (const auto& violation : violations) {
        if (!message.empty()) message += "; ";
        message += violation.name + ": " + violation.message;
    }
    return message;
}

// Shared by resolve() and load(). `pinned` receives the names set by the
// override file or explicit overrides.
bool resolve_values(const LoadOptions& options, LoadResult& result,
                    std::set<std::string>& pinned) {
    std::vector<Entry> entries;

    if (options.env_file) {
        result.source = options.env_file->string();
        auto parsed = read_env_file(*options.env_file);
        if (!parsed.success) {
            result.error = parsed.error;
            return false;
        }
        entries = std::move(parsed.entries);
    } else {
        auto roots = options.search_roots ? *options.search_roots
                                          : core::paths::project_search_paths();
        auto found = core::paths::find_first(roots, EnvLoader::default_source_names());
        if (found) {
            result.source = found->string();
            auto parsed = read_env_file(*found);
            if (!parsed.success) {
                result.error = parsed.error;
                return false;
            }
            entries = std::move(parsed.entries);
        } else {
            result.source = kBuiltinSource;
            entries = builtin_entries();
        }
    }
    spdlog::info("Configuration source: {}", result.source);

    EnvMap values = active_values(entries);

    const Profile* profile = find_profile(options.profile);
    if (!profile) {
        result.error = make_load_error(LoadErrorReason::INVALID, result.source,
                                       "unknown profile '" + options.profile + "'");
        return false;
    }
    apply_profile(*profile, entries, values);

    if (options.override_file) {
        auto parsed = read_env_file(*options.override_file);
        if (!parsed.success) {
            result.error = parsed.error;
            return false;
        }
        for (const auto& entry : parsed.entries) {
            if (!entry.enabled) continue;
            values[entry.name] = entry.value;
            pinned.insert(entry.name);
        }
    }

    for (const auto& [name, value] : options.overrides) {
        if (!is_valid_name(name)) {
            result.error = make_load_error(LoadErrorReason::INVALID, "<overrides>",
                                           "invalid variable name '" + name + "'");
            return false;
        }
        values[name] = value;
        pinned.insert(name);
    }

    auto violations = Schema::standard().validate(values);
    if (!violations.empty()) {
        result.error = make_load_error(LoadErrorReason::INVALID, result.source,
                                       describe(violations));
        return false;
    }

    if (options.include_derived) {
        auto settings = make_settings(values, result.source);
        if (!settings.success) {
            result.error = settings.error;
            return false;
        }
        // The agent framework variables are always forced
        for (const auto& [name, value] : derived_environment(settings.settings)) {
            values[name] = value;
            pinned.insert(name);
        }
    }

    result.values = std::move(values);
    return true;
}

} // namespace

EnvLoader::EnvLoader()
    : owned_environment_(std::make_unique<ProcessEnvironment>()),
      environment_(owned_environment_.get()) {}

EnvLoader::EnvLoader(Environment& environment) : environment_(&environment) {}

EnvLoader::~EnvLoader() = default;

const std::vector<std::string>& EnvLoader::default_source_names() {
    static const std::vector<std::string> names = {"env/setEnv.sh", ".env"};
    return names;
}

LoadResult EnvLoader::resolve(const LoadOptions& options) const {
    LoadResult result;
    std::set<std::string> pinned;
    result.success = resolve_values(options, result, pinned);
    return result;
}

LoadResult EnvLoader::load(const LoadOptions& options) {
    LoadResult result;
    std::set<std::string> pinned;
    if (!resolve_values(options, result, pinned)) {
        return result;
    }

    EnvMap effective;
    std::vector<std::pair<std::string, std::string>> writes;
    for (const auto& [name, value] : result.values) {
        auto managed = prior_values_.find(name);
        auto current = environment_->get(name);
        if (options.respect_existing && pinned.count(name) == 0) {
            if (managed == prior_values_.end() && current) {
                if (*current != value) {
                    spdlog::debug("Keeping existing {}={} (configured {})", name, *current, value);
                }
                effective[name] = *current;
                continue;
            }
            // Set before an earlier load replaced it: still external
            if (managed != prior_values_.end() && managed->second) {
                const std::string& external = *managed->second;
                effective[name] = external;
                if (!current || *current != external) {
                    writes.emplace_back(name, external);
                }
                continue;
            }
        }
        effective[name] = value;
        writes.emplace_back(name, value);
    }

    // External values are checked like configured ones
    auto violations = Schema::standard().validate(effective);
    if (!violations.empty()) {
        result.values.clear();
        result.error = make_load_error(LoadErrorReason::INVALID, "<environment>",
                                       describe(violations));
        return result;
    }

    std::vector<std::string> stale;
    for (const auto& [name, prior] : prior_values_) {
        if (effective.count(name) == 0) {
            stale.push_back(name);
        }
    }

    // Undo log for this call: name and its value before the change
    std::vector<std::pair<std::string, std::optional<std::string>>> journal;
    std::vector<std::string> newly_managed;
    auto fail = [&](const std::string& name) {
        for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
            if (!restore(it->first, it->second)) {
                spdlog::error("Rollback could not restore {}", it->first);
            }
        }
        for (const auto& managed : newly_managed) {
            prior_values_.erase(managed);
        }
        spdlog::error("Writing {} failed; rolled back {} change(s)", name, journal.size());
        result.success = false;
        result.values.clear();
        result.error = make_load_error(LoadErrorReason::ENVIRONMENT, result.source,
                                       "failed to update environment variable " + name);
        return result;
    };

    for (const auto& [name, value] : writes) {
        auto before = environment_->get(name);
        if (!environment_->set(name, value)) {
            return fail(name);
        }
        journal.emplace_back(name, before);
        if (prior_values_.count(name) == 0) {
            prior_values_[name] = before;
            newly_managed.push_back(name);
        }
    }

    for (const auto& name : stale) {
        auto before = environment_->get(name);
        if (!restore(name, prior_values_[name])) {
            return fail(name);
        }
        journal.emplace_back(name, before);
    }
    for (const auto& name : stale) {
        prior_values_.erase(name);
    }

    spdlog::info("Loaded {} variable(s) ({} written, {} restored) from {}",
                 effective.size(), writes.size(), stale.size(), result.source);
    result.values = std::move(effective);
    result.success = true;
    return result;
}

bool EnvLoader::unload() {
    bool ok = true;
    for (auto it = prior_values_.begin(); it != prior_values_.end();) {
        if (restore(it->first, it->second)) {
            it = prior_values_.erase(it);
        } else {
            spdlog::error("Could not restore {}", it->first);
            ok = false;
            ++it;
        }
    }
    return ok;
}

std::vector<std::string> EnvLoader::managed_names() const {
    std::vector<std::string> names;
    for (const auto& [name, prior] : prior_values_) {
        names.push_back(name);
    }
    return names;
}

bool EnvLoader::restore(const std::string& name, const std::optional<std::string>& value) {
    if (value) {
        return environment_->set(name, *value);
    }
    return environment_->unset(name);
}

} // namespace librarian::env
