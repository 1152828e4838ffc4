#pragma once
#include <optional>
#include <string>

namespace librarian::env {

// A mutable name -> value table the loader writes into
class Environment {
public:
    virtual ~Environment() = default;

    virtual std::optional<std::string> get(const std::string& name) const = 0;

    // Both return false if the table rejected the change
    virtual bool set(const std::string& name, const std::string& value) = 0;
    virtual bool unset(const std::string& name) = 0;
};

// The calling process's environment (getenv/setenv/unsetenv). Children
// spawned afterwards inherit it.
class ProcessEnvironment : public Environment {
public:
    std::optional<std::string> get(const std::string& name) const override;
    bool set(const std::string& name, const std::string& value) override;
    bool unset(const std::string& name) override;
};

} // namespace librarian::env
