/**
 * @file app_test.cpp
 * @brief Exit codes and output of the librarian-env command line
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "cli/app.hpp"
#include "test_utils.hpp"

namespace librarian {
namespace {

const std::string kShippedFile = std::string(LIBRARIAN_SOURCE_DIR) + "/env/setEnv.sh";

class CliTest : public ::testing::Test {
protected:
    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "librarian-env");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        out_.str("");
        err_.str("");
        return cli::run(static_cast<int>(args.size()), argv.data(), out_, err_);
    }

    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CliTest, ShowPrintsShellExports) {
    EXPECT_EQ(run({"-f", kShippedFile, "show"}), cli::EXIT_OK);
    EXPECT_NE(out_.str().find("export PROJECT_ID='d001-000-chiel-dev'"), std::string::npos);
    EXPECT_NE(out_.str().find("export LOG_LEVEL='ERROR'"), std::string::npos);
    EXPECT_EQ(out_.str().find("PLANNING_AGENT_MODEL"), std::string::npos);
}

TEST_F(CliTest, SetOverridesValue) {
    EXPECT_EQ(run({"-f", kShippedFile, "--set", "LOG_LEVEL=DEBUG", "show", "--format", "json"}),
              cli::EXIT_OK);
    EXPECT_NE(out_.str().find("\"LOG_LEVEL\": \"DEBUG\""), std::string::npos);
}

TEST_F(CliTest, CheckAndDeployEnv) {
    EXPECT_EQ(run({"-f", kShippedFile, "check"}), cli::EXIT_OK);
    EXPECT_NE(out_.str().find("d001-000-chiel-dev"), std::string::npos);

    EXPECT_EQ(run({"-f", kShippedFile, "deploy-env"}), cli::EXIT_OK);
    EXPECT_NE(out_.str().find("gs://project-librarian-engine-staging-d001-000-chiel-dev"),
              std::string::npos);
}

TEST_F(CliTest, ProfilesAndHelpSucceed) {
    EXPECT_EQ(run({"profiles"}), cli::EXIT_OK);
    EXPECT_NE(out_.str().find("all-agents"), std::string::npos);

    EXPECT_EQ(run({"--help"}), cli::EXIT_OK);
}

TEST_F(CliTest, MissingSourceIsConfigError) {
    test::TempDir dir;
    EXPECT_EQ(run({"-f", (dir.path() / "setEnv.sh").string(), "show"}), cli::EXIT_CONFIG_ERROR);
    EXPECT_NE(err_.str().find("setEnv.sh"), std::string::npos);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, UnknownProfileIsConfigError) {
    EXPECT_EQ(run({"-f", kShippedFile, "-p", "staging", "show"}), cli::EXIT_CONFIG_ERROR);
}

TEST_F(CliTest, MissingSubcommandIsUsageError) {
    EXPECT_EQ(run({}), cli::EXIT_USAGE);
}

TEST_F(CliTest, UnknownFormatIsUsageError) {
    EXPECT_EQ(run({"-f", kShippedFile, "show", "--format", "xml"}), cli::EXIT_USAGE);
}

TEST_F(CliTest, UnknownOptionIsUsageError) {
    EXPECT_EQ(run({"--no-such-flag", "show"}), cli::EXIT_USAGE);
}

TEST_F(CliTest, BadSetAssignmentsAreUsageErrors) {
    EXPECT_EQ(run({"-f", kShippedFile, "--set", "BAD NAME=x", "show"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"-f", kShippedFile, "--set", "NO_VALUE", "show"}), cli::EXIT_USAGE);
    EXPECT_EQ(run({"-f", kShippedFile, "--set", "=x", "show"}), cli::EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, ExecOfMissingCommand) {
    EXPECT_EQ(run({"-f", kShippedFile, "exec", "--", "/nonexistent/librarian-command"}),
              cli::EXIT_CANNOT_EXECUTE);
    EXPECT_NE(err_.str().find("cannot execute"), std::string::npos);
}

TEST_F(CliTest, ExecWithMissingSourceDoesNotRun) {
    test::TempDir dir;
    EXPECT_EQ(run({"-f", (dir.path() / "absent.sh").string(), "exec", "--", "/nonexistent/x"}),
              cli::EXIT_CONFIG_ERROR);
}

}  // namespace
}  // namespace librarian
