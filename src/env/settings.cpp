#include "env/settings.hpp"
#include "core/logger.hpp"
#include "env/schema.hpp"

namespace librarian::env {

namespace {

std::string value_or(const EnvMap& values, const std::string& name, const std::string& fallback) {
    auto it = values.find(name);
    return it == values.end() ? fallback : it->second;
}

} // namespace

const std::vector<AgentRole>& all_agent_roles() {
    static const std::vector<AgentRole> roles = {
        AgentRole::TASK_ANALYZER,
        AgentRole::PROJECT_ANALYZER,
        AgentRole::ADVICE_GENERATOR,
        AgentRole::PLANNING,
        AgentRole::GOOGLE_SEARCH,
        AgentRole::URL_CONTEXT,
        AgentRole::PROACTIVE_ADVISOR,
        AgentRole::ENTITY_MANAGER,
        AgentRole::PROJECT_ARCHIVIST,
    };
    return roles;
}

std::string agent_role_to_string(AgentRole role) {
    switch (role) {
        case AgentRole::TASK_ANALYZER:     return "task_analyzer";
        case AgentRole::PROJECT_ANALYZER:  return "project_analyzer";
        case AgentRole::ADVICE_GENERATOR:  return "advice_generator";
        case AgentRole::PLANNING:          return "planning";
        case AgentRole::GOOGLE_SEARCH:     return "google_search";
        case AgentRole::URL_CONTEXT:       return "url_context";
        case AgentRole::PROACTIVE_ADVISOR: return "proactive_advisor";
        case AgentRole::ENTITY_MANAGER:    return "entity_manager";
        case AgentRole::PROJECT_ARCHIVIST: return "project_archivist";
        default: return "unknown";
    }
}

std::optional<AgentRole> agent_role_from_string(const std::string& str) {
    for (AgentRole role : all_agent_roles()) {
        if (agent_role_to_string(role) == str) {
            return role;
        }
    }
    return std::nullopt;
}

std::string agent_model_variable(AgentRole role) {
    switch (role) {
        case AgentRole::TASK_ANALYZER:     return "TASK_ANALYZER_AGENT_MODEL";
        case AgentRole::PROJECT_ANALYZER:  return "PROJECT_ANALYZER_AGENT_MODEL";
        case AgentRole::ADVICE_GENERATOR:  return "ADVICE_GENERATOR_AGENT_MODEL";
        case AgentRole::PLANNING:          return "PLANNING_AGENT_MODEL";
        case AgentRole::GOOGLE_SEARCH:     return "GOOGLE_SEARCH_AGENT_MODEL";
        case AgentRole::URL_CONTEXT:       return "URL_CONTEXT_AGENT_MODEL";
        case AgentRole::PROACTIVE_ADVISOR: return "PROACTIVE_ADVISOR_MODEL";
        case AgentRole::ENTITY_MANAGER:    return "ENTITY_MANAGER_MODEL";
        case AgentRole::PROJECT_ARCHIVIST: return "PROJECT_ARCHIVIST_AGENT_MODEL";
        default: return "";
    }
}

std::string Settings::app_id() const {
    return reasoning_engine_id.empty() ? std::string("default-app") : reasoning_engine_id;
}

std::optional<std::string> Settings::model_for(AgentRole role) const {
    auto it = agent_models.find(role);
    if (it == agent_models.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Settings::resolve_model(AgentRole role) const {
    auto model = model_for(role);
    return model ? *model : default_model;
}

SettingsResult make_settings(const EnvMap& values, const std::string& source) {
    SettingsResult result;
    Settings& settings = result.settings;

    auto project = values.find("PROJECT_ID");
    if (project == values.end() || project->second.empty()) {
        result.error = make_load_error(LoadErrorReason::INVALID, source, "PROJECT_ID is not set");
        return result;
    }
    settings.project_id = project->second;
    settings.location = value_or(values, "LOCATION", settings.location);

    auto level_name = value_or(values, "LOG_LEVEL", "WARNING");
    auto level = core::parse_log_level(level_name);
    if (!level) {
        result.error = make_load_error(LoadErrorReason::INVALID, source,
                                       "LOG_LEVEL: unknown log level '" + level_name + "'");
        return result;
    }
    settings.log_level = *level;

    auto local_text = value_or(values, "IS_LOCAL", "false");
    auto is_local = parse_bool(local_text);
    if (!is_local) {
        result.error = make_load_error(LoadErrorReason::INVALID, source,
                                       "IS_LOCAL: invalid truth value '" + local_text + "'");
        return result;
    }
    settings.is_local = *is_local;

    settings.reasoning_engine_id = value_or(values, "PROJECT_LIBRARIAN_REASONING_ENGINE_ID", "");

    // "default" is accepted as shorthand for the default database
    auto database = value_or(values, "FIRESTORE_DB_NAME", settings.firestore_database);
    settings.firestore_database = database == "default" ? "(default)" : database;

    settings.staging_bucket = value_or(values, "STAGING_BUCKET_NAME", "");

    for (AgentRole role : all_agent_roles()) {
        auto it = values.find(agent_model_variable(role));
        if (it != values.end() && !it->second.empty()) {
            settings.agent_models[role] = it->second;
        }
    }

    result.success = true;
    return result;
}

EnvMap derived_environment(const Settings& settings) {
    EnvMap values;
    values["GOOGLE_CLOUD_PROJECT"] = settings.project_id;
    values["GOOGLE_CLOUD_LOCATION"] = settings.location;
    values["GOOGLE_GENAI_USE_VERTEXAI"] = "true";
    values["OTEL_SDK_DISABLED"] = "true";
    return values;
}

EnvMap deployment_environment(const Settings& settings) {
    EnvMap values;
    values["PROJECT_ID"] = settings.project_id;
    values["LOCATION"] = settings.location;
    values["FIRESTORE_DB_NAME"] = settings.firestore_database;
    values["PROJECT_LIBRARIAN_REASONING_ENGINE_ID"] = settings.reasoning_engine_id;
    return values;
}

std::string staging_bucket_uri(const Settings& settings) {
    return "gs://" + settings.staging_bucket;
}

nlohmann::json to_json(const Settings& settings) {
    nlohmann::json j;
    j["project_id"] = settings.project_id;
    j["location"] = settings.location;
    j["log_level"] = core::log_level_name(settings.log_level);
    j["is_local"] = settings.is_local;
    j["utc_offset_hours"] = settings.utc_offset_hours();
    j["reasoning_engine_id"] = settings.reasoning_engine_id;
    j["app_id"] = settings.app_id();
    j["firestore_database"] = settings.firestore_database;
    j["staging_bucket"] = settings.staging_bucket;

    nlohmann::json models = nlohmann::json::object();
    for (AgentRole role : all_agent_roles()) {
        auto model = settings.model_for(role);
        models[agent_role_to_string(role)] = model ? nlohmann::json(*model) : nlohmann::json(nullptr);
    }
    j["agent_models"] = models;
    j["default_model"] = settings.default_model;
    return j;
}

} // namespace librarian::env
