#pragma once

#include "capprobe/probe.hpp"
#include "capprobe/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace capprobe {

// ============================================================================
// Probe Registry
// ============================================================================

/**
 * @brief Ordered catalogue of the probes one subsystem depends on
 *
 * Used to pre-warm or report on every capability at once. Names are unique:
 * adding a probe whose name is already registered replaces the earlier
 * entry in place.
 */
class ProbeRegistry {
public:
    ProbeRegistry() = default;
    explicit ProbeRegistry(std::string name) : name_(std::move(name)) {}

    void add(Probe probe);

    const std::string& name() const { return name_; }
    const std::vector<Probe>& probes() const { return probes_; }
    std::size_t size() const { return probes_.size(); }

    std::optional<Probe> find(const std::string& probe_name) const;

    // Like find(), but an unregistered name is a PROBE_UNKNOWN error
    Result<Probe> get(const std::string& probe_name) const;

private:
    std::string name_;
    std::vector<Probe> probes_;
};

} // namespace capprobe
