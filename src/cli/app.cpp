#include "cli/app.hpp"
#include <CLI/CLI.hpp>
#include <cerrno>
#include <cstring>
#include <ostream>
#include <string>
#include <vector>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/logger.hpp"
#include "env/entry.hpp"
#include "env/env_file.hpp"
#include "env/loader.hpp"
#include "env/profile.hpp"
#include "env/settings.hpp"

using json = nlohmann::json;

namespace librarian::cli {

namespace {

int report(const env::ConfigLoadError& error, std::ostream& err) {
    err << "librarian-env: " << error.to_string() << std::endl;
    return EXIT_CONFIG_ERROR;
}

void print_summary(const std::string& source, const env::Settings& settings, std::ostream& out) {
    out << "source:              " << source << "\n";
    out << "project:             " << settings.project_id << " (" << settings.location << ")\n";
    out << "log level:           " << core::log_level_name(settings.log_level) << "\n";
    out << "mode:                " << (settings.is_local ? "local" : "cloud")
        << " (UTC+" << settings.utc_offset_hours() << ")\n";
    out << "reasoning engine:    " << settings.app_id() << "\n";
    out << "firestore database:  " << settings.firestore_database << "\n";
    out << "staging bucket:      " << env::staging_bucket_uri(settings) << "\n";
    for (env::AgentRole role : env::all_agent_roles()) {
        auto model = settings.model_for(role);
        out << "  " << env::agent_role_to_string(role) << ": "
             << (model ? *model : settings.default_model + " (unset, default)") << "\n";
    }
}

} // namespace

int run(int argc, char** argv, std::ostream& out, std::ostream& err) {
    CLI::App app{"librarian-env - Load the project librarian environment"};

    std::string env_file;
    std::string profile = "production";
    std::string override_file;
    std::vector<std::string> assignments;
    bool ignore_existing = false;
    bool adk = false;
    bool verbose = false;

    app.add_option("-f,--env-file", env_file, "Env file to load instead of the default search");
    app.add_option("-p,--profile", profile, "Override profile (see `profiles`)");
    app.add_option("-s,--set", assignments, "Override a variable: NAME=VALUE (repeatable)");
    app.add_option("-o,--override-file", override_file, "Env file whose assignments override the source");
    app.add_flag("--ignore-existing", ignore_existing, "Replace variables already set in the environment");
    app.add_flag("--adk", adk, "Also export GOOGLE_CLOUD_PROJECT and related agent framework variables");
    app.add_flag("-v,--verbose", verbose, "Debug logging");

    std::string format = "shell";
    auto* show = app.add_subcommand("show", "Print the resolved configuration");
    show->add_option("--format", format, "Output format: shell, dotenv or json")
        ->check(CLI::IsMember({"shell", "dotenv", "json"}));

    auto* check = app.add_subcommand("check", "Validate the configuration and print a summary");

    std::vector<std::string> command;
    auto* exec = app.add_subcommand("exec", "Load the configuration, then run a command in it");
    exec->add_option("command", command, "Command and its arguments (after --)")->required();

    auto* deploy = app.add_subcommand("deploy-env", "Print the variables passed to a deployed engine");
    auto* profiles = app.add_subcommand("profiles", "List override profiles");

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and friends exit 0; every parse failure is a usage error
        return app.exit(e, out, err) == 0 ? EXIT_OK : EXIT_USAGE;
    }

    core::init_logger();
    core::set_log_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    if (*profiles) {
        for (const auto& p : env::builtin_profiles()) {
            out << p.name << " - " << p.description << "\n";
        }
        return EXIT_OK;
    }

    env::LoadOptions options;
    if (!env_file.empty()) options.env_file = env_file;
    if (!override_file.empty()) options.override_file = override_file;
    options.profile = profile;
    options.respect_existing = !ignore_existing;
    options.include_derived = adk;
    for (const auto& assignment : assignments) {
        size_t eq_pos = assignment.find('=');
        if (eq_pos == std::string::npos || !env::is_valid_name(assignment.substr(0, eq_pos))) {
            err << "librarian-env: --set expects NAME=VALUE with a valid NAME, got '"
                << assignment << "'" << std::endl;
            return EXIT_USAGE;
        }
        options.overrides[assignment.substr(0, eq_pos)] = assignment.substr(eq_pos + 1);
    }

    env::EnvLoader loader;

    if (*exec) {
        auto result = loader.load(options);
        if (!result.success) {
            return report(*result.error, err);
        }

        std::vector<char*> args;
        for (auto& arg : command) {
            args.push_back(arg.data());
        }
        args.push_back(nullptr);
        execvp(args[0], args.data());

        err << "librarian-env: cannot execute " << command[0] << ": "
            << std::strerror(errno) << std::endl;
        return EXIT_CANNOT_EXECUTE;
    }

    auto result = loader.resolve(options);
    if (!result.success) {
        return report(*result.error, err);
    }

    auto settings = env::make_settings(result.values, result.source);
    if (!settings.success) {
        return report(*settings.error, err);
    }

    if (*show) {
        if (format == "json") {
            out << json(result.values).dump(2) << std::endl;
        } else if (format == "dotenv") {
            out << env::format_dotenv(result.values);
        } else {
            out << env::format_shell(result.values);
        }
        return EXIT_OK;
    }

    if (*check) {
        print_summary(result.source, settings.settings, out);
        return EXIT_OK;
    }

    if (*deploy) {
        json j;
        j["env_vars"] = env::deployment_environment(settings.settings);
        j["staging_bucket"] = env::staging_bucket_uri(settings.settings);
        out << j.dump(2) << std::endl;
        return EXIT_OK;
    }

    return EXIT_OK;
}

} // namespace librarian::cli
