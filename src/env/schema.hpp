#pragma once
#include <optional>
#include <string>
#include <vector>
#include "env/entry.hpp"

namespace librarian::env {

// How a value is interpreted by its consumers
enum class ValueKind {
    STRING,      // Free text, non-empty
    BOOL,        // y/yes/t/true/on/1 or n/no/f/false/off/0
    LOG_LEVEL,   // DEBUG, INFO, WARNING, ERROR, CRITICAL
    NUMERIC_ID,  // Decimal digits, kept as a string; may be empty
    MODEL        // Model name, non-empty
};

std::string value_kind_to_string(ValueKind kind);

struct KeySpec {
    std::string name;
    EntryGroup group = EntryGroup::COMMON;
    ValueKind kind = ValueKind::STRING;
    bool required = false;
    std::string description;
};

struct Violation {
    std::string name;
    std::string message;
};

class Schema {
public:
    explicit Schema(std::vector<KeySpec> keys);

    // Every variable the librarian system reads
    static const Schema& standard();

    const KeySpec* find(const std::string& name) const;
    const std::vector<KeySpec>& keys() const { return keys_; }

    // Names of the MODEL keys, in declaration order
    std::vector<std::string> model_keys() const;

    // All violations in `values`; empty when valid. Names not in the schema
    // are not checked.
    std::vector<Violation> validate(const EnvMap& values) const;

    // Check one value against its spec; fills `message` on failure
    static bool check_value(const KeySpec& spec, const std::string& value, std::string& message);

private:
    std::vector<KeySpec> keys_;
};

// Truth value of a string, nullopt if it is not one
std::optional<bool> parse_bool(const std::string& value);

} // namespace librarian::env
