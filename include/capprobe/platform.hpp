#pragma once

#include <optional>
#include <string>
#include <vector>

namespace capprobe {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Separator between entries of PATH (':' or ';')
char get_search_path_separator();

// Split a PATH-style value into directories. Empty entries are dropped.
std::vector<std::string> split_search_path(const std::string& value);

// ============================================================================
// Filesystem
// ============================================================================

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Regular file that the current user may execute
bool is_executable_file(const std::string& path);

struct WriteResult {
    bool ok = false;
    std::string error;
};

// Write content to a file, replacing it
WriteResult write_file(const std::string& path, const std::string& content);

// System temporary directory
std::string get_temp_directory();

// ============================================================================
// Strings
// ============================================================================

std::string trim_trailing_whitespace(const std::string& s);

} // namespace capprobe
