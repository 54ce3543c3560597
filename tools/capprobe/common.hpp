/**
 * capprobe CLI - Common utilities and types
 */

#pragma once

#include <capprobe/capprobe.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capprobe::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

// Thread-local warning collector for the current command
inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    // Include any collected warnings in the output
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Load the configuration selected by --config / CAPPROBE_CONFIG and apply
 * its log level. Returns nullopt (after reporting) when the file is unusable.
 */
inline std::optional<ProbeConfig> load_config(const GlobalOptions& opts) {
    ProbeConfig config = get_default_config();

    auto path = resolve_config_path(
        opts.config.empty() ? std::nullopt : std::make_optional(opts.config));
    if (path) {
        auto parsed = load_probe_config(*path);
        if (!parsed.ok) {
            Error error(ErrorCode::CONFIG_PARSE_ERROR, parsed.error);
            print_error(error.withContext("invalid configuration " + *path).message(), opts.json);
            return std::nullopt;
        }
        for (const auto& w : parsed.warnings) {
            print_warning(w + " (" + *path + ")");
        }
        config = parsed.config;
    }

    if (opts.verbose) {
        config.log_level = "debug";
    } else if (opts.quiet) {
        config.log_level = "off";
    }
    if (!apply_log_level(config.log_level)) {
        print_warning("unknown log level '" + config.log_level + "'");
    }

    return config;
}

inline nlohmann::json result_to_json(const ProbeResult& result) {
    nlohmann::json j;
    j["name"] = result.subject_name();
    j["present"] = result.present();
    if (result.reason()) {
        j["reason"] = *result.reason();
    }
    return j;
}

inline nlohmann::json probe_to_json(const Probe& probe) {
    nlohmann::json j;
    j["name"] = probe.name();
    j["kind"] = kind_to_string(probe.kind());
    if (!probe.hint().package.empty()) {
        j["package"] = probe.hint().package;
    }
    if (!probe.hint().url.empty()) {
        j["url"] = probe.hint().url;
    }
    nlohmann::json deps = nlohmann::json::array();
    for (const auto& dep : dependencies(probe)) {
        deps.push_back(dep.name());
    }
    j["dependencies"] = deps;
    return j;
}

inline void print_result(const ProbeResult& result) {
    std::cout << (result.present() ? "[yes] " : "[no]  ") << result.subject_name();
    if (result.reason()) {
        std::cout << ": " << *result.reason();
    }
    std::cout << std::endl;
}

} // namespace capprobe::cli
