#pragma once

/**
 * @file test_utils.hpp
 * @brief Common test utilities
 */

#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <set>
#include <string>

#include "env/entry.hpp"
#include "env/environment.hpp"

namespace librarian {
namespace test {

/**
 * @brief RAII helper for temporary test directory
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "librarian_test_") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        path_ = std::filesystem::temp_directory_path() /
                (prefix + std::to_string(dis(gen)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    // Write `content` to a file below the directory, creating parents
    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto file_path = path_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream out(file_path);
        out << content;
        return file_path;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief In-memory environment; writes to names in `fail_on` are rejected
 */
class FakeEnvironment : public env::Environment {
public:
    std::optional<std::string> get(const std::string& name) const override {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    bool set(const std::string& name, const std::string& value) override {
        if (fail_on.count(name)) return false;
        values[name] = value;
        return true;
    }

    bool unset(const std::string& name) override {
        if (fail_on.count(name)) return false;
        values.erase(name);
        return true;
    }

    env::EnvMap values;
    std::set<std::string> fail_on;
};

}  // namespace test
}  // namespace librarian
