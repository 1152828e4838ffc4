/**
 * Typed librarian configuration
 *
 * Built once from a resolved mapping and handed to consumers by const
 * reference, so nothing downstream reads the process environment directly.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "env/entry.hpp"
#include "env/error.hpp"

namespace librarian::env {

// Agents that take a per-agent model variable
enum class AgentRole {
    TASK_ANALYZER,
    PROJECT_ANALYZER,
    ADVICE_GENERATOR,
    PLANNING,
    GOOGLE_SEARCH,
    URL_CONTEXT,
    PROACTIVE_ADVISOR,
    ENTITY_MANAGER,
    PROJECT_ARCHIVIST
};

const std::vector<AgentRole>& all_agent_roles();

// "task_analyzer", "entity_manager", ...
std::string agent_role_to_string(AgentRole role);
std::optional<AgentRole> agent_role_from_string(const std::string& str);

// Environment variable carrying the role's model
std::string agent_model_variable(AgentRole role);

struct Settings {
    std::string project_id;
    std::string location = "us-central1";
    spdlog::level::level_enum log_level = spdlog::level::warn;
    bool is_local = false;
    std::string reasoning_engine_id;  // Numeric, kept as text; may be empty
    std::string firestore_database = "(default)";
    std::string staging_bucket;

    // Only roles whose variable is set appear here
    std::map<AgentRole, std::string> agent_models;

    // Used by resolve_model() for roles without a variable
    std::string default_model = "gemini-2.0-flash";

    // Hours added to UTC timestamps shown to users: 0 locally, JST otherwise
    int utc_offset_hours() const { return is_local ? 0 : 9; }

    // Reasoning-engine ID, or "default-app" when none is configured
    std::string app_id() const;

    // Configured model; nullopt means the variable is unset
    std::optional<std::string> model_for(AgentRole role) const;

    // Configured model, or default_model
    std::string resolve_model(AgentRole role) const;
};

struct SettingsResult {
    bool success = false;
    Settings settings;
    std::optional<ConfigLoadError> error;
};

// Build typed settings from a resolved mapping. `source` names the mapping
// in errors.
SettingsResult make_settings(const EnvMap& values, const std::string& source);

// Variables the agent framework expects alongside the librarian's own
EnvMap derived_environment(const Settings& settings);

// Variables handed to a deployed reasoning engine
EnvMap deployment_environment(const Settings& settings);

// gs:// URI of the staging bucket
std::string staging_bucket_uri(const Settings& settings);

nlohmann::json to_json(const Settings& settings);

} // namespace librarian::env
