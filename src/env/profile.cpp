#include "env/profile.hpp"
#include "env/schema.hpp"
#include <spdlog/spdlog.h>

namespace librarian::env {

const std::vector<Profile>& builtin_profiles() {
    static const std::vector<Profile> profiles = [] {
        std::vector<Profile> list;

        Profile production;
        production.name = "production";
        production.description = "Values exactly as defined in the source";
        list.push_back(production);

        Profile debug;
        debug.name = "debug";
        debug.description = "Verbose agent logging";
        debug.set["LOG_LEVEL"] = "DEBUG";
        list.push_back(debug);

        Profile local;
        local.name = "local";
        local.description = "Run agents locally with verbose logging";
        local.set["IS_LOCAL"] = "true";
        local.set["LOG_LEVEL"] = "DEBUG";
        list.push_back(local);

        Profile all_agents;
        all_agents.name = "all-agents";
        all_agents.description = "Activate every disabled agent model";
        all_agents.enable = Schema::standard().model_keys();
        list.push_back(all_agents);

        return list;
    }();
    return profiles;
}

const Profile* find_profile(const std::string& name) {
    for (const auto& profile : builtin_profiles()) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

void apply_profile(const Profile& profile, const std::vector<Entry>& entries, EnvMap& values) {
    for (const auto& name : profile.enable) {
        if (values.count(name)) continue;

        auto value = inactive_value(entries, name);
        if (!value) {
            value = inactive_value(builtin_entries(), name);
        }
        if (!value) {
            spdlog::debug("Profile {}: no disabled value for {}, skipping", profile.name, name);
            continue;
        }
        values[name] = *value;
    }

    for (const auto& [name, value] : profile.set) {
        values[name] = value;
    }
}

} // namespace librarian::env
