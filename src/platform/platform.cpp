#include "capprobe/platform.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace capprobe {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

char get_search_path_separator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

std::vector<std::string> split_search_path(const std::string& value) {
    std::vector<std::string> dirs;
    std::string current;
    std::istringstream ss(value);
    while (std::getline(ss, current, get_search_path_separator())) {
        if (!current.empty()) {
            dirs.push_back(current);
        }
    }
    return dirs;
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    if (rel.empty()) return base;
    return (fs::path(base) / rel).string();
}

bool is_executable_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

WriteResult write_file(const std::string& path, const std::string& content) {
    WriteResult result;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.error = "failed to open " + path + " for writing";
        return result;
    }
    file << content;
    file.close();
    if (!file) {
        result.error = "failed to write " + path;
        return result;
    }
    result.ok = true;
    return result;
}

std::string get_temp_directory() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec) {
        return ".";
    }
    return dir.string();
}

std::string trim_trailing_whitespace(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(0, end);
}

} // namespace capprobe
