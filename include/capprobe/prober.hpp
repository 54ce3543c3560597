#pragma once

/**
 * @file prober.hpp
 * @brief Caller-facing capability queries
 *
 * Prober evaluates probes against the environment. It owns the external
 * adapters (search-path lookup, file resolver, process runner) and holds the
 * cache the verdicts are memoized in.
 *
 * @example
 * ```cpp
 * #include <capprobe/latex.hpp>
 * #include <capprobe/prober.hpp>
 *
 * auto prober = capprobe::Prober::create();
 * auto result = prober->is_present(capprobe::latex_package("tkz-graph"));
 * if (!result) {
 *     std::cerr << *result.reason() << "\n";
 * }
 * ```
 */

#include "capprobe/config.hpp"
#include "capprobe/exec.hpp"
#include "capprobe/probe.hpp"
#include "capprobe/probe_cache.hpp"
#include "capprobe/resolver.hpp"
#include "capprobe/result.hpp"
#include "capprobe/search_path.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace capprobe {

/**
 * @brief External collaborators of a Prober
 *
 * locator, resolver and runner must be non-null; a null cache is replaced
 * by a private one. Tests substitute doubles here.
 */
struct ProberCollaborators {
    std::shared_ptr<ExecutableLocator> locator;
    std::shared_ptr<FileResolver> resolver;
    std::shared_ptr<exec::ProcessRunner> runner;
    std::shared_ptr<ProbeCache> cache;
};

class Prober {
public:
    /**
     * @brief Create a Prober backed by the real environment
     *
     * Uses SearchPathLocator, SubprocessResolver and SubprocessRunner
     * configured from `config`. Verdicts depend on the search path, so only
     * Probers searching the plain PATH share the process-wide cache; a
     * config with `search_path.prepend` gets a private one.
     */
    static std::unique_ptr<Prober> create(const ProbeConfig& config = get_default_config());

    Prober(ProbeConfig config, ProberCollaborators collaborators);

    /**
     * @brief Cheap existence check
     *
     * Consults the cache first. Absence is a normal result carrying a
     * reason, never an error.
     */
    ProbeResult is_present(const Probe& probe);

    /**
     * @brief Existence plus the executable's functional check
     *
     * Requires is_present() to succeed, then runs the functional check. A
     * failing check yields present=false with a reason distinct from the
     * not-found reason. Probes without a functional check fall back to
     * is_present().
     */
    ProbeResult is_functional(const Probe& probe);

    /**
     * @brief Absolute path of a static file or executable probe
     * @return The path, or ErrorCode::NOT_PRESENT with the same reason
     *         is_present() gives; ErrorCode::NOT_A_FILE for composites
     */
    Result<std::string> absolute_filename(const Probe& probe);

    /// NOT_PRESENT error, explained and with install hints, when absent
    Result<void> require(const Probe& probe);

    const ProbeConfig& config() const { return config_; }
    ProbeCache& cache() { return *collaborators_.cache; }

private:
    ProbeResult check_executable(const ExecutableProbe& probe);
    ProbeResult check_static_file(const StaticFileProbe& probe);
    ProbeResult check_composite(const CompositeProbe& probe);
    ProbeResult run_functional_check(const ExecutableProbe& probe);

    // First absent probe of `probes`, in order
    std::optional<ProbeResult> first_absent(const std::vector<Probe>& probes);

    std::optional<std::string> remembered_location(const std::string& key) const;
    void remember_location(const std::string& key, const std::string& path);

    ProbeConfig config_;
    ProberCollaborators collaborators_;

    mutable std::mutex locations_mutex_;
    std::unordered_map<std::string, std::string> locations_;
};

// Install hint text for an absent probe; empty when the probe carries no hint
std::string resolution(const Probe& probe);

} // namespace capprobe
