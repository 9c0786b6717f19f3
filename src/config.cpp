// =============================================================================
// config.cpp - TOML configuration loading
// =============================================================================

#include "clamm/config.hpp"

#include <fstream>
#include <sstream>

namespace clamm {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("Invalid boolean for '" + key + "': " + value);
}

int parse_int(const std::string& key, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid integer for '" + key + "': " + value);
    }
    if (used != value.size()) {
        throw ConfigError("Invalid integer for '" + key + "': " + value);
    }
    return v;
}

double parse_double(const std::string& key, const std::string& value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid number for '" + key + "': " + value);
    }
    if (used != value.size()) {
        throw ConfigError("Invalid number for '" + key + "': " + value);
    }
    return v;
}

// Accepts "A, B, C" or a TOML array ["A", "B", "C"]
std::vector<std::string> parse_list(const std::string& value) {
    std::string body = value;
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }
    std::vector<std::string> items;
    std::istringstream stream{body};
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "verbose") config.general.verbose = parse_bool(key, value);
        }
        else if (current_section == "analysis") {
            if (key == "bound_tolerance") {
                config.analysis.bound_tolerance = parse_double(key, value);
                if (!(config.analysis.bound_tolerance >= 0.0)) {
                    throw ConfigError("bound_tolerance must be non-negative");
                }
            }
            else if (key == "stablecoins") config.analysis.stablecoins = parse_list(value);
            else if (key == "show_empty_ranges") config.analysis.show_empty_ranges = parse_bool(key, value);
            else if (key == "iv_days") {
                config.analysis.iv_days = parse_int(key, value);
                if (config.analysis.iv_days < 1) {
                    throw ConfigError("iv_days must be at least 1");
                }
            }
        }
    }

    return config;
}

LogLevel Config::effective_log_level() const {
    if (general.verbose) return LogLevel::Debug;
    LogLevel level = LogLevel::Info;
    if (!parse_log_level(general.log_level, level)) {
        throw ConfigError("Unknown log_level: " + general.log_level);
    }
    return level;
}

} // namespace clamm
