#include "env/schema.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace librarian::env {

namespace {

KeySpec make_spec(const std::string& name, EntryGroup group, ValueKind kind, bool required,
                  const std::string& description) {
    KeySpec spec;
    spec.name = name;
    spec.group = group;
    spec.kind = kind;
    spec.required = required;
    spec.description = description;
    return spec;
}

} // namespace

std::string value_kind_to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::STRING:     return "string";
        case ValueKind::BOOL:       return "bool";
        case ValueKind::LOG_LEVEL:  return "log_level";
        case ValueKind::NUMERIC_ID: return "numeric_id";
        case ValueKind::MODEL:      return "model";
        default: return "unknown";
    }
}

Schema::Schema(std::vector<KeySpec> keys) : keys_(std::move(keys)) {}

const Schema& Schema::standard() {
    static const Schema schema({
        make_spec("PROJECT_ID", EntryGroup::COMMON, ValueKind::STRING, true,
                  "Cloud project the agents run in"),
        make_spec("LOCATION", EntryGroup::COMMON, ValueKind::STRING, true,
                  "Deployment region"),
        make_spec("LOG_LEVEL", EntryGroup::COMMON, ValueKind::LOG_LEVEL, false,
                  "Logging verbosity of the agents"),
        make_spec("IS_LOCAL", EntryGroup::COMMON, ValueKind::BOOL, false,
                  "Run locally instead of on the reasoning engine"),
        make_spec("PROJECT_LIBRARIAN_REASONING_ENGINE_ID", EntryGroup::COMMON,
                  ValueKind::NUMERIC_ID, false, "Reasoning-engine resource hosting the librarian"),

        make_spec("TASK_ANALYZER_AGENT_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the task-analyzer agent"),
        make_spec("PROJECT_ANALYZER_AGENT_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the project-analyzer agent"),
        make_spec("ADVICE_GENERATOR_AGENT_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the advice-generator agent"),
        make_spec("PLANNING_AGENT_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the planning agent"),
        make_spec("GOOGLE_SEARCH_AGENT_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the search agent"),
        make_spec("URL_CONTEXT_AGENT_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the URL-context agent"),
        make_spec("PROACTIVE_ADVISOR_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the proactive-advisor agent"),
        make_spec("ENTITY_MANAGER_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the entity-manager agent"),
        make_spec("PROJECT_ARCHIVIST_AGENT_MODEL", EntryGroup::AGENT, ValueKind::MODEL, false,
                  "Model of the project-archivist agent"),

        make_spec("FIRESTORE_DB_NAME", EntryGroup::FIRESTORE, ValueKind::STRING, true,
                  "Firestore database instance"),

        make_spec("STAGING_BUCKET_NAME", EntryGroup::DEPLOY, ValueKind::STRING, true,
                  "Cloud storage bucket used for deployment staging"),
    });
    return schema;
}

const KeySpec* Schema::find(const std::string& name) const {
    for (const auto& spec : keys_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> Schema::model_keys() const {
    std::vector<std::string> names;
    for (const auto& spec : keys_) {
        if (spec.kind == ValueKind::MODEL) {
            names.push_back(spec.name);
        }
    }
    return names;
}

std::vector<Violation> Schema::validate(const EnvMap& values) const {
    std::vector<Violation> violations;

    for (const auto& spec : keys_) {
        auto it = values.find(spec.name);
        if (it == values.end()) {
            if (spec.required) {
                violations.push_back({spec.name, "required variable is not set"});
            }
            continue;
        }
        std::string message;
        if (!check_value(spec, it->second, message)) {
            violations.push_back({spec.name, message});
        }
    }

    for (const auto& [name, value] : values) {
        if (!find(name)) {
            spdlog::debug("{} is not a known variable; passing it through unchecked", name);
        }
    }
    return violations;
}

bool Schema::check_value(const KeySpec& spec, const std::string& value, std::string& message) {
    switch (spec.kind) {
        case ValueKind::BOOL:
            if (!parse_bool(value)) {
                message = "invalid truth value '" + value + "'";
                return false;
            }
            return true;
        case ValueKind::LOG_LEVEL:
            if (!core::parse_log_level(value)) {
                message = "unknown log level '" + value + "'";
                return false;
            }
            return true;
        case ValueKind::NUMERIC_ID:
            if (!std::all_of(value.begin(), value.end(),
                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
                message = "expected decimal digits, got '" + value + "'";
                return false;
            }
            return true;
        case ValueKind::STRING:
        case ValueKind::MODEL:
        default:
            if (value.empty()) {
                message = "value must not be empty";
                return false;
            }
            return true;
    }
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower;
    for (char c : value) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "y" || lower == "yes" || lower == "t" || lower == "true" ||
        lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "n" || lower == "no" || lower == "f" || lower == "false" ||
        lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

} // namespace librarian::env
