#include "capprobe/prober.hpp"
#include "capprobe/scratch.hpp"

#include <spdlog/spdlog.h>

namespace capprobe {

namespace {

// Basename of the scratch input handed to a functional check
constexpr const char* kScratchInputStem = "capprobe-check";

std::string not_on_path_reason(const std::string& command) {
    return "executable '" + command + "' not found on PATH";
}

std::string functional_reason(const std::string& command, const std::string& detail) {
    return "running '" + command + "' on a sample file " + detail;
}

ProbeResult log_verdict(ProbeResult result) {
    if (!result.present()) {
        spdlog::debug("probe '{}' absent: {}", result.subject_name(), *result.reason());
    } else {
        spdlog::debug("probe '{}' present", result.subject_name());
    }
    return result;
}

} // namespace

std::unique_ptr<Prober> Prober::create(const ProbeConfig& config) {
    ProberCollaborators collaborators;
    collaborators.locator = std::make_shared<SearchPathLocator>(config.search_path.prepend);
    collaborators.runner = std::make_shared<exec::SubprocessRunner>();
    collaborators.resolver = std::make_shared<SubprocessResolver>(
        collaborators.locator, collaborators.runner, config.timeout);
    if (config.search_path.prepend.empty()) {
        collaborators.cache = process_cache();
    } else {
        collaborators.cache = std::make_shared<ProbeCache>();
    }
    return std::make_unique<Prober>(config, std::move(collaborators));
}

Prober::Prober(ProbeConfig config, ProberCollaborators collaborators)
    : config_(std::move(config)), collaborators_(std::move(collaborators)) {
    if (!collaborators_.cache) {
        collaborators_.cache = std::make_shared<ProbeCache>();
    }
}

// ============================================================================
// Dispatch
// ============================================================================

ProbeResult Prober::is_present(const Probe& probe) {
    return collaborators_.cache->get_or_compute(
        probe_key(probe, CheckMode::Presence), [this, &probe]() {
            if (const auto* exe = std::get_if<ExecutableProbe>(&probe.variant)) {
                return log_verdict(check_executable(*exe));
            }
            if (const auto* file = std::get_if<StaticFileProbe>(&probe.variant)) {
                return log_verdict(check_static_file(*file));
            }
            return log_verdict(check_composite(std::get<CompositeProbe>(probe.variant)));
        });
}

ProbeResult Prober::is_functional(const Probe& probe) {
    const auto* exe = std::get_if<ExecutableProbe>(&probe.variant);
    if (!exe || !exe->functional_check) {
        return is_present(probe);
    }

    return collaborators_.cache->get_or_compute(
        probe_key(probe, CheckMode::Functional), [this, &probe, exe]() {
            ProbeResult presence = is_present(probe);
            if (!presence) {
                return presence;
            }
            return log_verdict(run_functional_check(*exe));
        });
}

Result<std::string> Prober::absolute_filename(const Probe& probe) {
    if (probe.kind() == ProbeKind::Composite) {
        return Result<std::string>::err(
            Error(ErrorCode::NOT_A_FILE,
                  "'" + probe.name() + "' is a composite probe and has no file"));
    }

    ProbeResult presence = is_present(probe);
    if (!presence) {
        return Result<std::string>::err(Error(ErrorCode::NOT_PRESENT, *presence.reason()));
    }

    std::string key = probe_key(probe);
    if (auto path = remembered_location(key)) {
        return Result<std::string>::ok(*path);
    }

    // Verdict came from a cache shared with another Prober; look the path up again
    if (const auto* exe = std::get_if<ExecutableProbe>(&probe.variant)) {
        auto path = collaborators_.locator->find(exe->command);
        if (!path) {
            return Result<std::string>::err(
                Error(ErrorCode::NOT_PRESENT, not_on_path_reason(exe->command)));
        }
        remember_location(key, *path);
        return Result<std::string>::ok(*path);
    }

    const auto& file = std::get<StaticFileProbe>(probe.variant);
    auto resolved = collaborators_.resolver->resolve(file.resolver, file.filename);
    if (resolved.isOk()) {
        remember_location(key, resolved.value());
    }
    return resolved;
}

Result<void> Prober::require(const Probe& probe) {
    ProbeResult result = is_present(probe);
    if (result) {
        return Result<void>::ok();
    }

    std::string message = probe.name() + " is not available: " + *result.reason();
    std::string hint = resolution(probe);
    if (!hint.empty()) {
        message += ". " + hint;
    }
    return Result<void>::err(Error(ErrorCode::NOT_PRESENT, message));
}

// ============================================================================
// Kind-specific checks
// ============================================================================

ProbeResult Prober::check_executable(const ExecutableProbe& probe) {
    auto path = collaborators_.locator->find(probe.command);
    if (!path) {
        return ProbeResult::missing(probe.name, not_on_path_reason(probe.command));
    }
    remember_location(probe_key(ProbeKind::Executable, probe.name), *path);
    return ProbeResult::found(probe.name);
}

ProbeResult Prober::check_static_file(const StaticFileProbe& probe) {
    // The resolver is never invoked while a dependency is absent
    if (auto absent = first_absent(probe.dependencies)) {
        return ProbeResult::missing(probe.name, *absent->reason());
    }

    auto resolved = collaborators_.resolver->resolve(probe.resolver, probe.filename);
    if (resolved.isErr()) {
        return ProbeResult::missing(probe.name, resolved.error().message());
    }

    remember_location(probe_key(ProbeKind::StaticFile, probe.name), resolved.value());
    return ProbeResult::found(probe.name);
}

ProbeResult Prober::check_composite(const CompositeProbe& probe) {
    if (auto absent = first_absent(probe.members)) {
        return ProbeResult::missing(probe.name, *absent->reason());
    }
    return ProbeResult::found(probe.name);
}

std::optional<ProbeResult> Prober::first_absent(const std::vector<Probe>& probes) {
    for (const auto& member : probes) {
        ProbeResult result = is_present(member);
        if (!result) {
            return result;
        }
    }
    return std::nullopt;
}

ProbeResult Prober::run_functional_check(const ExecutableProbe& probe) {
    const FunctionalCheck& check = *probe.functional_check;

    std::string key = probe_key(ProbeKind::Executable, probe.name);
    auto program = remembered_location(key);
    if (!program) {
        program = collaborators_.locator->find(probe.command);
        if (!program) {
            return ProbeResult::missing(probe.name, not_on_path_reason(probe.command));
        }
        remember_location(key, *program);
    }

    auto scratch = ScratchDirectory::create(config_.scratch_root);
    if (scratch.isErr()) {
        spdlog::warn("cannot prepare functional check for '{}': {}", probe.name,
                     scratch.error().message());
        return ProbeResult::missing(
            probe.name, functional_reason(probe.command, "could not be prepared: " +
                                                             scratch.error().message()));
    }

    std::string input_name = std::string(kScratchInputStem) + check.input_extension;
    auto input = scratch.value().write_file(input_name, check.input);
    if (input.isErr()) {
        return ProbeResult::missing(
            probe.name,
            functional_reason(probe.command, "could not be prepared: " + input.error().message()));
    }

    exec::ExecRequest request;
    request.argv.push_back(*program);
    for (const auto& arg : check.arguments) {
        request.argv.push_back(arg);
    }
    request.argv.push_back(input_name);
    request.cwd = scratch.value().path();
    request.timeout = config_.timeout;

    spdlog::debug("functional check: {} in {}", *program, request.cwd);
    auto result = collaborators_.runner->run(request);

    if (!result.ok) {
        spdlog::warn("functional check of '{}' could not run: {}", probe.name, result.error);
        return ProbeResult::missing(probe.name,
                                    functional_reason(probe.command, "failed to run: " + result.error));
    }
    if (result.timed_out) {
        spdlog::warn("functional check of '{}' timed out", probe.name);
        return ProbeResult::missing(
            probe.name, functional_reason(probe.command, "timed out after " +
                                                             std::to_string(config_.timeout.count()) +
                                                             " ms"));
    }
    if (result.term_signal != 0) {
        spdlog::warn("functional check of '{}' {}", probe.name, exec::describe_termination(result));
        return ProbeResult::missing(
            probe.name, functional_reason(probe.command, "was terminated by signal " +
                                                             std::to_string(result.term_signal)));
    }
    if (result.exit_code != 0) {
        return ProbeResult::missing(
            probe.name, functional_reason(probe.command, "returned non-zero exit status " +
                                                             std::to_string(result.exit_code)));
    }

    return ProbeResult::found(probe.name);
}

// ============================================================================
// Locations
// ============================================================================

std::optional<std::string> Prober::remembered_location(const std::string& key) const {
    std::lock_guard<std::mutex> lock(locations_mutex_);
    auto it = locations_.find(key);
    if (it == locations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Prober::remember_location(const std::string& key, const std::string& path) {
    std::lock_guard<std::mutex> lock(locations_mutex_);
    locations_[key] = path;
}

// ============================================================================
// Resolution hints
// ============================================================================

std::string resolution(const Probe& probe) {
    const InstallHint& hint = probe.hint();
    std::string text;
    if (!hint.package.empty()) {
        text = "To install " + probe.name() + " you can try installing the package '" +
               hint.package + "'.";
    }
    if (!hint.url.empty()) {
        if (!text.empty()) text += " ";
        text += "Further installation instructions might be available at " + hint.url + ".";
    }
    return text;
}

} // namespace capprobe
