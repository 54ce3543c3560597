#include "capprobe/scratch.hpp"
#include "capprobe/platform.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <random>
#include <system_error>

#include <spdlog/spdlog.h>

namespace capprobe {

namespace fs = std::filesystem;

namespace {

std::string random_suffix() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
    return std::string(buf);
}

} // namespace

Result<ScratchDirectory> ScratchDirectory::create(const std::string& root,
                                                  const std::string& prefix) {
    std::string base = root.empty() ? get_temp_directory() : root;

    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        return Result<ScratchDirectory>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "scratch root is not a directory: " + base));
    }

    // Retry on the unlikely name collision
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::string candidate = join_path(base, prefix + random_suffix());
        ec.clear();
        if (fs::create_directory(candidate, ec)) {
            return Result<ScratchDirectory>::ok(ScratchDirectory(candidate));
        }
        if (ec) {
            return Result<ScratchDirectory>::err(
                Error(ErrorCode::IO_ERROR,
                      "failed to create scratch directory " + candidate + ": " + ec.message()));
        }
    }

    return Result<ScratchDirectory>::err(
        Error(ErrorCode::IO_ERROR, "failed to create a unique scratch directory under " + base));
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDirectory::~ScratchDirectory() {
    remove();
}

void ScratchDirectory::remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("failed to remove scratch directory {}: {}", path_, ec.message());
    }
    path_.clear();
}

Result<std::string> ScratchDirectory::write_file(const std::string& name,
                                                 const std::string& content) const {
    std::string file_path = join_path(path_, name);
    auto written = capprobe::write_file(file_path, content);
    if (!written.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, written.error));
    }
    return Result<std::string>::ok(file_path);
}

} // namespace capprobe
