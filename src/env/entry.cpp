#include "env/entry.hpp"
#include <cctype>

namespace librarian::env {

namespace {

const std::string kDefaultModel = "gemini-2.5-flash";

Entry make_entry(const std::string& name, const std::string& value, bool enabled,
                 EntryGroup group) {
    Entry entry;
    entry.name = name;
    entry.value = value;
    entry.enabled = enabled;
    entry.group = group;
    return entry;
}

} // namespace

std::string entry_group_to_string(EntryGroup group) {
    switch (group) {
        case EntryGroup::COMMON:    return "common";
        case EntryGroup::AGENT:     return "agent";
        case EntryGroup::FIRESTORE: return "firestore";
        case EntryGroup::DEPLOY:    return "deploy";
        default: return "other";
    }
}

EntryGroup entry_group_from_string(const std::string& str) {
    std::string lower;
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "common") return EntryGroup::COMMON;
    if (lower == "agent" || lower == "agents") return EntryGroup::AGENT;
    if (lower == "firestore") return EntryGroup::FIRESTORE;
    if (lower == "deploy" || lower == "deployment") return EntryGroup::DEPLOY;
    return EntryGroup::OTHER;
}

const std::vector<Entry>& builtin_entries() {
    static const std::vector<Entry> entries = {
        make_entry("PROJECT_ID", "d001-000-chiel-dev", true, EntryGroup::COMMON),
        make_entry("LOCATION", "us-central1", true, EntryGroup::COMMON),
        make_entry("LOG_LEVEL", "DEBUG", false, EntryGroup::COMMON),
        make_entry("LOG_LEVEL", "ERROR", true, EntryGroup::COMMON),
        make_entry("IS_LOCAL", "false", true, EntryGroup::COMMON),
        make_entry("PROJECT_LIBRARIAN_REASONING_ENGINE_ID", "4566541170502533120", true,
                   EntryGroup::COMMON),

        make_entry("TASK_ANALYZER_AGENT_MODEL", kDefaultModel, false, EntryGroup::AGENT),
        make_entry("PROJECT_ANALYZER_AGENT_MODEL", kDefaultModel, false, EntryGroup::AGENT),
        make_entry("ADVICE_GENERATOR_AGENT_MODEL", kDefaultModel, false, EntryGroup::AGENT),
        make_entry("PLANNING_AGENT_MODEL", kDefaultModel, false, EntryGroup::AGENT),
        make_entry("GOOGLE_SEARCH_AGENT_MODEL", kDefaultModel, false, EntryGroup::AGENT),
        make_entry("URL_CONTEXT_AGENT_MODEL", kDefaultModel, false, EntryGroup::AGENT),
        make_entry("PROACTIVE_ADVISOR_MODEL", kDefaultModel, false, EntryGroup::AGENT),
        make_entry("ENTITY_MANAGER_MODEL", kDefaultModel, true, EntryGroup::AGENT),
        make_entry("PROJECT_ARCHIVIST_AGENT_MODEL", kDefaultModel, true, EntryGroup::AGENT),

        make_entry("FIRESTORE_DB_NAME", "(default)", true, EntryGroup::FIRESTORE),

        make_entry("STAGING_BUCKET_NAME", "project-librarian-engine-staging-d001-000-chiel-dev",
                   true, EntryGroup::DEPLOY),
    };
    return entries;
}

bool is_valid_name(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') return false;
    }
    return true;
}

EnvMap active_values(const std::vector<Entry>& entries) {
    EnvMap values;
    for (const auto& entry : entries) {
        if (entry.enabled) {
            values[entry.name] = entry.value;
        }
    }
    return values;
}

std::optional<std::string> inactive_value(const std::vector<Entry>& entries,
                                          const std::string& name) {
    for (const auto& entry : entries) {
        if (!entry.enabled && entry.name == name) {
            return entry.value;
        }
    }
    return std::nullopt;
}

} // namespace librarian::env
