#include "capprobe/search_path.hpp"
#include "capprobe/platform.hpp"

#include <filesystem>
#include <system_error>

namespace capprobe {

namespace fs = std::filesystem;

namespace {

bool has_directory_component(const std::string& command) {
    if (command.find('/') != std::string::npos) return true;
#ifdef _WIN32
    if (command.find('\\') != std::string::npos) return true;
#endif
    return false;
}

std::string absolute_of(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    return abs.lexically_normal().string();
}

} // namespace

std::vector<std::string> SearchPathLocator::search_directories() const {
    std::vector<std::string> dirs = prepend_;
    if (auto path = get_env("PATH")) {
        for (auto& dir : split_search_path(*path)) {
            dirs.push_back(std::move(dir));
        }
    }
    return dirs;
}

std::optional<std::string> SearchPathLocator::find(const std::string& command) {
    if (command.empty()) {
        return std::nullopt;
    }

    if (has_directory_component(command)) {
        if (is_executable_file(command)) {
            return absolute_of(command);
        }
        return std::nullopt;
    }

    for (const auto& dir : search_directories()) {
        std::string candidate = join_path(dir, command);
        if (is_executable_file(candidate)) {
            return absolute_of(candidate);
        }
#ifdef _WIN32
        if (is_executable_file(candidate + ".exe")) {
            return absolute_of(candidate + ".exe");
        }
#endif
    }

    return std::nullopt;
}

} // namespace capprobe
