#include "capprobe/config.hpp"
#include "capprobe/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace capprobe {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& level) {
    std::string lower = to_lower(trim(level));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace

ProbeConfig get_default_config() {
    return ProbeConfig{};
}

ConfigParseResult parse_probe_config(const std::string& json_str,
                                     const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        // "search_path" section
        if (j.contains("search_path")) {
            if (j["search_path"].is_object()) {
                result.config.search_path.prepend = get_string_array(j["search_path"], "prepend");
            } else {
                result.warnings.push_back("invalid_configuration:search_path");
            }
        }

        // "timeout_ms"
        if (j.contains("timeout_ms")) {
            const auto& t = j["timeout_ms"];
            // Bounded by what poll() accepts
            if (t.is_number_unsigned() && t.get<unsigned long long>() <= MAX_TIMEOUT_MS) {
                result.config.timeout = std::chrono::milliseconds(t.get<long long>());
            } else {
                result.warnings.push_back("invalid_configuration:timeout_ms");
            }
        }

        // "scratch_root"
        if (auto root = get_string(j, "scratch_root")) {
            result.config.scratch_root = *root;
        }

        // "log_level"
        if (auto level = get_string(j, "log_level")) {
            if (is_valid_log_level(*level)) {
                result.config.log_level = to_lower(trim(*level));
            } else {
                result.warnings.push_back("invalid_configuration:log_level:" + *level);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_probe_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "config file not found: " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_probe_config(ss.str(), path);
}

std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path) {
    // 1. Explicit override
    if (override_path && !override_path->empty()) {
        return override_path;
    }

    // 2. Environment variable
    auto env_path = get_env("CAPPROBE_CONFIG");
    if (env_path && !env_path->empty()) {
        return env_path;
    }

    // 3. Built-in defaults
    return std::nullopt;
}

bool is_valid_log_level(const std::string& level) {
    return parse_level(level).has_value();
}

bool apply_log_level(const std::string& level) {
    std::string effective = level;
    if (auto env_level = get_env("CAPPROBE_LOG_LEVEL")) {
        if (is_valid_log_level(*env_level)) {
            effective = *env_level;
        } else {
            spdlog::warn("ignoring unknown CAPPROBE_LOG_LEVEL '{}'", *env_level);
        }
    }

    auto parsed = parse_level(effective);
    if (!parsed) {
        return false;
    }
    spdlog::set_level(*parsed);
    return true;
}

} // namespace capprobe
