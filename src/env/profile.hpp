#pragma once
#include <string>
#include <vector>
#include "env/entry.hpp"

namespace librarian::env {

// A named set of overrides applied on top of a source
struct Profile {
    std::string name;
    std::string description;
    EnvMap set;                       // Assigned (and activated) as given
    std::vector<std::string> enable;  // Activated at their disabled value
};

const std::vector<Profile>& builtin_profiles();

// nullptr if no profile has this name
const Profile* find_profile(const std::string& name);

// Apply `profile` onto `values`. Names in `enable` take the disabled value
// from `entries`, falling back to the built-in table; names with no disabled
// value anywhere are skipped.
void apply_profile(const Profile& profile, const std::vector<Entry>& entries, EnvMap& values);

} // namespace librarian::env
