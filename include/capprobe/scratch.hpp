#pragma once

#include "capprobe/result.hpp"

#include <string>

namespace capprobe {

// ============================================================================
// Scratch Directory
// ============================================================================

/**
 * @brief Uniquely named directory removed, with its contents, on destruction
 *
 * Owned by exactly one check; never shared between concurrent checks.
 */
class ScratchDirectory {
public:
    // Create a fresh directory `<root>/<prefix><random>`. An empty root means
    // the system temporary directory.
    static Result<ScratchDirectory> create(const std::string& root = "",
                                           const std::string& prefix = "capprobe-");

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ~ScratchDirectory();

    const std::string& path() const { return path_; }

    // Write `content` to `<path>/<name>` and return the full file path
    Result<std::string> write_file(const std::string& name, const std::string& content) const;

private:
    explicit ScratchDirectory(std::string path) : path_(std::move(path)) {}

    void remove();

    std::string path_;
};

} // namespace capprobe
