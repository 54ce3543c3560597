#include "capprobe/probe_cache.hpp"

#include <spdlog/spdlog.h>

namespace capprobe {

ProbeResult ProbeCache::get_or_compute(const std::string& key, const ComputeFn& compute) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            spdlog::trace("probe cache hit: {}", key);
            return it->second;
        }
    }

    spdlog::debug("probe cache miss: {}", key);
    ProbeResult computed = compute();

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.emplace(key, std::move(computed));
    if (!inserted) {
        spdlog::debug("probe {} was computed concurrently, keeping first result", key);
    }
    return it->second;
}

std::optional<ProbeResult> ProbeCache::lookup(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ProbeCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ProbeCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::shared_ptr<ProbeCache> process_cache() {
    static std::shared_ptr<ProbeCache> cache = std::make_shared<ProbeCache>();
    return cache;
}

} // namespace capprobe
