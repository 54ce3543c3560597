#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace capprobe {

// ============================================================================
// Probe Configuration
// ============================================================================

constexpr const char* CONFIG_SCHEMA = "capprobe.config.v1";

// Largest accepted timeout_ms (INT_MAX, about 24.8 days)
constexpr unsigned long long MAX_TIMEOUT_MS = 2147483647ULL;

struct ProbeConfig {
    std::string schema = CONFIG_SCHEMA;

    // "search_path" section: directories searched before PATH
    struct {
        std::vector<std::string> prepend;
    } search_path;

    // Bound on every external invocation; 0 waits indefinitely
    std::chrono::milliseconds timeout{0};

    // Where functional checks create their scratch directories; empty means
    // the system temporary directory
    std::string scratch_root;

    // spdlog level name
    std::string log_level = "warn";

    // Source path for diagnostics
    std::string source_path;
};

ProbeConfig get_default_config();

// ============================================================================
// Parsing
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    ProbeConfig config;
    std::vector<std::string> warnings;
};

// Parse a configuration document from a JSON string. Invalid optional values
// are reported in `warnings` and left at their defaults.
ConfigParseResult parse_probe_config(const std::string& json_str,
                                     const std::string& source_path = "");

// Read and parse a configuration file
ConfigParseResult load_probe_config(const std::string& path);

// Configuration file to use: explicit path > CAPPROBE_CONFIG > none
std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path);

// ============================================================================
// Logging
// ============================================================================

// Set the spdlog level from a level name. CAPPROBE_LOG_LEVEL, when set, takes
// precedence. Returns false (and leaves the level unchanged) for an unknown name.
bool apply_log_level(const std::string& level);

bool is_valid_log_level(const std::string& level);

} // namespace capprobe
