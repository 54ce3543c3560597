#include "capprobe/resolver.hpp"
#include "capprobe/platform.hpp"

#include <spdlog/spdlog.h>

namespace capprobe {

std::string not_found_by_reason(const std::string& filename, const std::string& tool) {
    return "'" + filename + "' not found by " + tool;
}

SubprocessResolver::SubprocessResolver(std::shared_ptr<ExecutableLocator> locator,
                                       std::shared_ptr<exec::ProcessRunner> runner,
                                       std::chrono::milliseconds timeout)
    : locator_(std::move(locator)), runner_(std::move(runner)), timeout_(timeout) {}

Result<std::string> SubprocessResolver::resolve(const std::string& tool,
                                                const std::string& filename) {
    auto tool_path = locator_->find(tool);
    if (!tool_path) {
        return Result<std::string>::err(
            Error(ErrorCode::NOT_PRESENT, "executable '" + tool + "' not found on PATH"));
    }

    exec::ExecRequest request;
    request.argv = {*tool_path, filename};
    request.capture_stdout = true;
    request.timeout = timeout_;

    spdlog::debug("resolving '{}' with {}", filename, *tool_path);
    auto result = runner_->run(request);

    if (!result.ok || result.timed_out || result.term_signal != 0) {
        std::string how = exec::describe_termination(result);
        spdlog::warn("{} did not complete normally while resolving '{}': {}", tool, filename, how);
        return Result<std::string>::err(
            Error(ErrorCode::NOT_PRESENT,
                  "'" + filename + "' could not be resolved: " + tool + " " + how));
    }

    if (result.exit_code != 0) {
        return Result<std::string>::err(
            Error(ErrorCode::NOT_PRESENT, not_found_by_reason(filename, tool)));
    }

    std::string path = trim_trailing_whitespace(result.output);
    if (path.empty()) {
        // Success without an answer is still no answer
        return Result<std::string>::err(
            Error(ErrorCode::NOT_PRESENT, not_found_by_reason(filename, tool)));
    }

    return Result<std::string>::ok(path);
}

} // namespace capprobe
