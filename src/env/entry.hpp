#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace librarian::env {

// Informal section an entry is listed under ("## agent", "## firestore", ...)
enum class EntryGroup {
    COMMON,     // Entries before any section header
    AGENT,      // Per-agent model names
    FIRESTORE,  // Firestore database selection
    DEPLOY,     // Deployment-only values
    OTHER       // Any other section header
};

std::string entry_group_to_string(EntryGroup group);

// Section header word to group; unknown words map to OTHER
EntryGroup entry_group_from_string(const std::string& str);

// A single configuration assignment. Disabled entries are defined but
// never exported.
struct Entry {
    std::string name;
    std::string value;
    bool enabled = true;
    EntryGroup group = EntryGroup::COMMON;
    size_t line = 0;  // 0 = built-in
};

// Resolved name -> value mapping
using EnvMap = std::map<std::string, std::string>;

// The entries the project ships with, in declaration order
const std::vector<Entry>& builtin_entries();

// [A-Za-z_][A-Za-z0-9_]*
bool is_valid_name(const std::string& name);

// Name -> value of every enabled entry
EnvMap active_values(const std::vector<Entry>& entries);

// Value of the first disabled entry with this name, if any
std::optional<std::string> inactive_value(const std::vector<Entry>& entries,
                                          const std::string& name);

} // namespace librarian::env
