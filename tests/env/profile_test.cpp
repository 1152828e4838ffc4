/**
 * @file profile_test.cpp
 * @brief Unit tests for override profiles
 */

#include <gtest/gtest.h>

#include "env/profile.hpp"

namespace librarian {
namespace {

TEST(ProfileTest, BuiltinProfilesExist) {
    for (const char* name : {"production", "debug", "local", "all-agents"}) {
        EXPECT_NE(env::find_profile(name), nullptr) << name;
    }
    EXPECT_EQ(env::find_profile("staging"), nullptr);
}

TEST(ProfileTest, ProductionChangesNothing) {
    auto values = env::active_values(env::builtin_entries());
    auto before = values;
    env::apply_profile(*env::find_profile("production"), env::builtin_entries(), values);
    EXPECT_EQ(values, before);
}

TEST(ProfileTest, DebugRaisesLogLevelOnly) {
    auto values = env::active_values(env::builtin_entries());
    auto expected = values;
    expected["LOG_LEVEL"] = "DEBUG";

    env::apply_profile(*env::find_profile("debug"), env::builtin_entries(), values);
    EXPECT_EQ(values, expected);
}

TEST(ProfileTest, LocalSwitchesMode) {
    auto values = env::active_values(env::builtin_entries());
    env::apply_profile(*env::find_profile("local"), env::builtin_entries(), values);
    EXPECT_EQ(values["IS_LOCAL"], "true");
    EXPECT_EQ(values["LOG_LEVEL"], "DEBUG");
}

TEST(ProfileTest, AllAgentsEnablesDisabledModels) {
    auto values = env::active_values(env::builtin_entries());
    env::apply_profile(*env::find_profile("all-agents"), env::builtin_entries(), values);

    for (const char* name : {"TASK_ANALYZER_AGENT_MODEL", "PLANNING_AGENT_MODEL",
                             "PROACTIVE_ADVISOR_MODEL", "ENTITY_MANAGER_MODEL"}) {
        EXPECT_EQ(values[name], "gemini-2.5-flash") << name;
    }
    EXPECT_EQ(values["LOG_LEVEL"], "ERROR");
}

TEST(ProfileTest, EnablePrefersSourceValue) {
    std::vector<env::Entry> entries = env::builtin_entries();
    env::Entry custom;
    custom.name = "PLANNING_AGENT_MODEL";
    custom.value = "gemini-2.5-pro";
    custom.enabled = false;
    entries.insert(entries.begin(), custom);

    env::EnvMap values;
    env::apply_profile(*env::find_profile("all-agents"), entries, values);
    EXPECT_EQ(values["PLANNING_AGENT_MODEL"], "gemini-2.5-pro");
}

TEST(ProfileTest, EnableKeepsActiveValue) {
    env::EnvMap values = {{"ENTITY_MANAGER_MODEL", "custom-model"}};
    env::apply_profile(*env::find_profile("all-agents"), env::builtin_entries(), values);
    EXPECT_EQ(values["ENTITY_MANAGER_MODEL"], "custom-model");
}

}  // namespace
}  // namespace librarian
