#pragma once

#include <optional>
#include <string>
#include <vector>

namespace capprobe {

// ============================================================================
// Executable Lookup
// ============================================================================

class ExecutableLocator {
public:
    virtual ~ExecutableLocator() = default;

    // Absolute path of `command`, or nullopt when it cannot be found.
    // Never runs the program.
    virtual std::optional<std::string> find(const std::string& command) = 0;
};

/**
 * Resolves commands the way a shell does: the configured prefix
 * directories first, then every entry of PATH in order. A command that
 * already contains a directory separator is only checked in place.
 *
 * PATH is read on every lookup; callers cache verdicts, not this class.
 */
class SearchPathLocator : public ExecutableLocator {
public:
    SearchPathLocator() = default;
    explicit SearchPathLocator(std::vector<std::string> prepend)
        : prepend_(std::move(prepend)) {}

    std::optional<std::string> find(const std::string& command) override;

    // Directories searched, in order
    std::vector<std::string> search_directories() const;

private:
    std::vector<std::string> prepend_;
};

} // namespace capprobe
