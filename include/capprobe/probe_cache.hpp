#pragma once

#include "capprobe/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace capprobe {

// ============================================================================
// Probe Cache
// ============================================================================

/**
 * @brief Memoized probe verdicts keyed by probe identity (see probe_key())
 *
 * Entries never expire: capability availability is assumed stable for the
 * lifetime of the cache. The table is guarded by a single mutex, but the
 * mutex is released while a result is computed, so a composite can evaluate
 * its members through the same cache. Two threads computing the same key for
 * the first time may both run the computation; the first stored result wins
 * and both callers receive it.
 */
class ProbeCache {
public:
    using ComputeFn = std::function<ProbeResult()>;

    ProbeResult get_or_compute(const std::string& key, const ComputeFn& compute);

    std::optional<ProbeResult> lookup(const std::string& key) const;

    std::size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProbeResult> entries_;
};

// Cache shared by every Prober created through Prober::create(). Created on
// first use, destroyed at process exit.
std::shared_ptr<ProbeCache> process_cache();

} // namespace capprobe
