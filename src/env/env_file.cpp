#include "env/env_file.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>

namespace librarian::env {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

// Split NAME=VALUE (optionally prefixed with `export`). Returns false when
// the text is not a single well-formed assignment.
bool parse_assignment(const std::string& text, std::string& name, std::string& value) {
    std::string rest = text;
    if (rest.compare(0, 6, "export") == 0 && rest.size() > 6 && is_blank(rest[6])) {
        rest = trim(rest.substr(6));
    }

    size_t eq_pos = rest.find('=');
    if (eq_pos == std::string::npos) return false;

    std::string key = rest.substr(0, eq_pos);
    if (!is_valid_name(key)) return false;

    std::string raw = trim(rest.substr(eq_pos + 1));

    // Quoted value: everything up to the matching quote, then only an
    // optional trailing comment
    if (!raw.empty() && (raw.front() == '"' || raw.front() == '\'')) {
        char quote = raw.front();
        size_t close = raw.find(quote, 1);
        if (close == std::string::npos) return false;
        std::string tail = trim(raw.substr(close + 1));
        if (!tail.empty() && tail.front() != '#') return false;
        name = key;
        value = raw.substr(1, close - 1);
        return true;
    }

    // Unquoted value: a trailing " # comment" is dropped
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '#' && i > 0 && is_blank(raw[i - 1])) {
            raw = trim(raw.substr(0, i));
            break;
        }
    }
    for (char c : raw) {
        if (is_blank(c)) return false;
    }

    name = key;
    value = raw;
    return true;
}

} // namespace

ParseResult parse_env_text(const std::string& text, const std::string& source) {
    ParseResult result;
    EntryGroup group = EntryGroup::COMMON;
    std::unordered_map<std::string, size_t> active_lines;

    std::istringstream stream(text);
    std::string raw_line;
    size_t line_no = 0;
    while (std::getline(stream, raw_line)) {
        ++line_no;
        std::string line = trim(raw_line);
        if (line.empty()) continue;

        if (line[0] == '#') {
            if (line_no == 1 && line.compare(0, 2, "#!") == 0) continue;

            size_t hashes = line.find_first_not_of('#');
            if (hashes == std::string::npos) continue;
            std::string body = trim(line.substr(hashes));

            // "## agent" starts a section
            if (hashes >= 2) {
                if (!body.empty()) {
                    group = entry_group_from_string(body);
                }
                continue;
            }

            // "# export NAME=VALUE" is a disabled entry; other comments are notes
            std::string name;
            std::string value;
            if (parse_assignment(body, name, value)) {
                Entry entry;
                entry.name = name;
                entry.value = value;
                entry.enabled = false;
                entry.group = group;
                entry.line = line_no;
                result.entries.push_back(std::move(entry));
            }
            continue;
        }

        std::string name;
        std::string value;
        if (!parse_assignment(line, name, value)) {
            result.error = make_load_error(LoadErrorReason::MALFORMED, source,
                                           "expected NAME=VALUE, got '" + line + "'", line_no);
            return result;
        }

        auto seen = active_lines.find(name);
        if (seen != active_lines.end()) {
            result.error = make_load_error(
                LoadErrorReason::MALFORMED, source,
                "duplicate assignment of " + name + " (first at line " +
                    std::to_string(seen->second) + ")",
                line_no);
            return result;
        }
        active_lines[name] = line_no;

        Entry entry;
        entry.name = name;
        entry.value = value;
        entry.enabled = true;
        entry.group = group;
        entry.line = line_no;
        result.entries.push_back(std::move(entry));
    }

    result.success = true;
    return result;
}

ParseResult read_env_file(const std::filesystem::path& path) {
    ParseResult result;
    const std::string source = path.string();

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        result.error = make_load_error(LoadErrorReason::MISSING, source,
                                       "configuration source not found");
        return result;
    }
    if (std::filesystem::is_directory(status)) {
        result.error = make_load_error(LoadErrorReason::UNREADABLE, source,
                                       "configuration source is a directory");
        return result;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = make_load_error(LoadErrorReason::UNREADABLE, source,
                                       "cannot open configuration source");
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        result.error = make_load_error(LoadErrorReason::UNREADABLE, source,
                                       "error while reading configuration source");
        return result;
    }

    return parse_env_text(buffer.str(), source);
}

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string format_shell(const EnvMap& values) {
    std::string out;
    for (const auto& [name, value] : values) {
        out += "export " + name + "=" + shell_quote(value) + "\n";
    }
    return out;
}

std::string format_dotenv(const EnvMap& values) {
    std::string out;
    for (const auto& [name, value] : values) {
        bool plain = !value.empty();
        for (char c : value) {
            if (is_blank(c) || c == '"' || c == '\'' || c == '#') {
                plain = false;
                break;
            }
        }
        if (plain) {
            out += name + "=" + value + "\n";
        } else if (value.find('"') == std::string::npos) {
            out += name + "=\"" + value + "\"\n";
        } else {
            // No escape syntax in env files; a value with both quote kinds
            // is written single-quoted and will not read back unchanged
            out += name + "='" + value + "'\n";
        }
    }
    return out;
}

} // namespace librarian::env
