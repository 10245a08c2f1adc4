#pragma once

#include "cache/cache_store.hpp"
#include "core/error.hpp"
#include "provider/iprovider_adapter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cdnlocator {

/**
 * @brief Cache-first decorator around a provider adapter.
 *
 * fetch_with_cache():
 *   1. A FRESH, non-empty snapshot is returned without touching the network.
 *   2. Otherwise exactly one live fetch runs. Its failure is returned as-is
 *      (expired data is never served). A non-empty result is normalized and
 *      written back; a failed write is logged and counted only.
 *
 * Thread-safety: safe to call concurrently. Racing callers may each do a
 * live fetch; the snapshot file is replaced atomically.
 */
class CachedProvider {
public:
    struct Stats {
        uint64_t cache_hits = 0;
        uint64_t live_fetches = 0;
        uint64_t fetch_failures = 0;
        uint64_t write_failures = 0;
    };

    CachedProvider(std::unique_ptr<IProviderAdapter> adapter, CacheStore cache);

    [[nodiscard]] Result<std::vector<std::string>> fetch_with_cache();

    /// Skip the cache read; still writes a non-empty result back
    [[nodiscard]] Result<std::vector<std::string>> fetch_live();

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const CacheStore& cache() const { return cache_; }

    [[nodiscard]] Stats get_stats() const;

private:
    std::string name_;
    std::unique_ptr<IProviderAdapter> adapter_;
    CacheStore cache_;

    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> live_fetches_{0};
    std::atomic<uint64_t> fetch_failures_{0};
    std::atomic<uint64_t> write_failures_{0};
};

} // namespace cdnlocator
