#pragma once

/**
 * @file probe.hpp
 * @brief Probe kinds as a closed tagged variant
 *
 * A probe is a named, evaluable capability check. Probes are plain values:
 * two probes with equal fields are interchangeable, so constructing "the
 * same" probe twice yields substitutable objects. Evaluation lives in
 * Prober (prober.hpp); this header only describes what to check.
 */

#include "capprobe/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace capprobe {

struct Probe;

// ============================================================================
// Probe Kinds
// ============================================================================

// Present iff `command` is discoverable on the search path.
struct ExecutableProbe {
    std::string name;
    std::string command;
    InstallHint hint;
    std::optional<FunctionalCheck> functional_check;

    bool operator==(const ExecutableProbe& other) const;
    bool operator!=(const ExecutableProbe& other) const { return !(*this == other); }
};

// Present iff every dependency is present and `resolver <filename>` succeeds.
struct StaticFileProbe {
    std::string name;
    std::string filename;
    std::string resolver;
    std::vector<Probe> dependencies;
    InstallHint hint;

    bool operator==(const StaticFileProbe& other) const;
    bool operator!=(const StaticFileProbe& other) const { return !(*this == other); }
};

// Present iff every member is present, evaluated in declaration order.
struct CompositeProbe {
    std::string name;
    std::vector<Probe> members;
    InstallHint hint;

    bool operator==(const CompositeProbe& other) const;
    bool operator!=(const CompositeProbe& other) const { return !(*this == other); }
};

struct Probe {
    using Variant = std::variant<ExecutableProbe, StaticFileProbe, CompositeProbe>;

    Probe(ExecutableProbe p) : variant(std::move(p)) {}
    Probe(StaticFileProbe p) : variant(std::move(p)) {}
    Probe(CompositeProbe p) : variant(std::move(p)) {}

    const std::string& name() const;
    ProbeKind kind() const;
    const InstallHint& hint() const;

    bool operator==(const Probe& other) const;
    bool operator!=(const Probe& other) const { return !(*this == other); }

    Variant variant;
};

// ============================================================================
// Construction
// ============================================================================

ExecutableProbe make_executable_probe(std::string name,
                                      std::string command,
                                      InstallHint hint = {},
                                      std::optional<FunctionalCheck> functional_check = std::nullopt);

StaticFileProbe make_static_file_probe(std::string name,
                                       std::string filename,
                                       std::string resolver,
                                       std::vector<Probe> dependencies = {},
                                       InstallHint hint = {});

CompositeProbe make_composite_probe(std::string name,
                                    std::vector<Probe> members,
                                    InstallHint hint = {});

// ============================================================================
// Introspection
// ============================================================================

// Probes this one is joined with: composite members, static file
// dependencies, nothing for executables.
const std::vector<Probe>& dependencies(const Probe& probe);

// Cache identity: kind, name and check mode.
std::string probe_key(const Probe& probe, CheckMode mode = CheckMode::Presence);
std::string probe_key(ProbeKind kind, const std::string& name, CheckMode mode = CheckMode::Presence);

} // namespace capprobe
