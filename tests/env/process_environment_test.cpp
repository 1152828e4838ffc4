/**
 * @file process_environment_test.cpp
 * @brief Tests against the real process environment
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "env/loader.hpp"

namespace librarian {
namespace {

TEST(ProcessEnvironmentTest, SetGetUnset) {
    env::ProcessEnvironment environment;
    const std::string name = "LIBRARIAN_TEST_VARIABLE";

    EXPECT_TRUE(environment.set(name, "value"));
    EXPECT_EQ(environment.get(name), "value");
    EXPECT_STREQ(std::getenv(name.c_str()), "value");

    EXPECT_TRUE(environment.unset(name));
    EXPECT_FALSE(environment.get(name).has_value());
}

TEST(ProcessEnvironmentTest, RejectsInvalidName) {
    env::ProcessEnvironment environment;
    EXPECT_FALSE(environment.set("BAD=NAME", "x"));
}

class ProcessLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto& entry : env::builtin_entries()) {
            unsetenv(entry.name.c_str());
        }
        options_.search_roots = std::vector<std::filesystem::path>{};
    }

    void TearDown() override {
        loader_.unload();
    }

    env::EnvLoader loader_;
    env::LoadOptions options_;
};

TEST_F(ProcessLoadTest, LoadIntoProcess) {
    auto result = loader_.load(options_);
    ASSERT_TRUE(result.success) << result.error->to_string();

    for (const auto& entry : env::builtin_entries()) {
        const char* value = std::getenv(entry.name.c_str());
        if (entry.enabled) {
            ASSERT_NE(value, nullptr) << entry.name;
            EXPECT_EQ(std::string(value), entry.value) << entry.name;
        } else if (entry.name != "LOG_LEVEL") {
            EXPECT_EQ(value, nullptr) << entry.name;
        }
    }
}

TEST_F(ProcessLoadTest, UnloadClearsProcess) {
    ASSERT_TRUE(loader_.load(options_).success);
    ASSERT_TRUE(loader_.unload());
    EXPECT_EQ(std::getenv("PROJECT_ID"), nullptr);
    EXPECT_EQ(std::getenv("STAGING_BUCKET_NAME"), nullptr);
}

}  // namespace
}  // namespace librarian
