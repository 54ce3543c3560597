#include "capprobe/registry.hpp"

#include <algorithm>

namespace capprobe {

void ProbeRegistry::add(Probe probe) {
    auto it = std::find_if(probes_.begin(), probes_.end(),
                           [&probe](const Probe& p) { return p.name() == probe.name(); });
    if (it != probes_.end()) {
        *it = std::move(probe);
        return;
    }
    probes_.push_back(std::move(probe));
}

std::optional<Probe> ProbeRegistry::find(const std::string& probe_name) const {
    for (const auto& p : probes_) {
        if (p.name() == probe_name) {
            return p;
        }
    }
    return std::nullopt;
}

Result<Probe> ProbeRegistry::get(const std::string& probe_name) const {
    if (auto probe = find(probe_name)) {
        return Result<Probe>::ok(std::move(*probe));
    }
    return Result<Probe>::err(
        Error(ErrorCode::PROBE_UNKNOWN, "unknown probe '" + probe_name + "' in registry " + name_));
}

} // namespace capprobe
