#pragma once

#include "capprobe/exec.hpp"
#include "capprobe/result.hpp"
#include "capprobe/search_path.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace capprobe {

// ============================================================================
// File Resolution
// ============================================================================

/**
 * @brief Maps a logical file name to an absolute path through an external tool
 *
 * The search convention belongs to the tool (e.g. kpsewhich and the TeX
 * directory structure). Every failure is an Error with
 * ErrorCode::NOT_PRESENT whose message is suitable for display.
 */
class FileResolver {
public:
    virtual ~FileResolver() = default;

    virtual Result<std::string> resolve(const std::string& tool, const std::string& filename) = 0;
};

/**
 * Runs `<tool> <filename>`. Exit status zero with the path on stdout means
 * found; any other exit status means not found. A crash, a timeout or a
 * spawn failure is also reported as not found, with a generic reason.
 */
class SubprocessResolver : public FileResolver {
public:
    SubprocessResolver(std::shared_ptr<ExecutableLocator> locator,
                       std::shared_ptr<exec::ProcessRunner> runner,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    Result<std::string> resolve(const std::string& tool, const std::string& filename) override;

private:
    std::shared_ptr<ExecutableLocator> locator_;
    std::shared_ptr<exec::ProcessRunner> runner_;
    std::chrono::milliseconds timeout_;
};

// Reason used when `tool` reports `filename` as missing
std::string not_found_by_reason(const std::string& filename, const std::string& tool);

} // namespace capprobe
