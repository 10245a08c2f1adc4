#include "provider/cached_provider.hpp"
#include "range/range_entry.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace cdnlocator {

CachedProvider::CachedProvider(std::unique_ptr<IProviderAdapter> adapter, CacheStore cache)
    : adapter_(std::move(adapter)),
      cache_(std::move(cache)) {
    if (!adapter_) {
        throw std::invalid_argument("CachedProvider requires an adapter");
    }
    name_ = adapter_->name();
}

Result<std::vector<std::string>> CachedProvider::fetch_with_cache() {
    auto cached = cache_.read();
    if (cached.usable()) {
        cache_hits_.fetch_add(1, std::memory_order_relaxed);
        return Result<std::vector<std::string>>::ok(std::move(cached.ranges));
    }

    utils::log::debug(std::format("[{}] cache {}: {}", name_,
        cache_status_to_string(cached.status),
        cached.error.empty() ? "empty snapshot" : cached.error));

    return fetch_live();
}

Result<std::vector<std::string>> CachedProvider::fetch_live() {
    live_fetches_.fetch_add(1, std::memory_order_relaxed);

    auto fetched = adapter_->fetch();
    if (fetched.is_error()) {
        fetch_failures_.fetch_add(1, std::memory_order_relaxed);
        return fetched;
    }

    auto ranges = RangeEntry::normalize(fetched.value());
    if (!ranges.empty()) {
        const auto written = cache_.write(ranges);
        if (written.is_error()) {
            write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("[{}] cache write failed ({}): {}", name_,
                error_category_to_string(written.error_category()), written.error_message()));
        } else {
            utils::log::debug(std::format("[{}] cached {} ranges at {}",
                name_, ranges.size(), written.value().string()));
        }
    }

    return Result<std::vector<std::string>>::ok(std::move(ranges));
}

CachedProvider::Stats CachedProvider::get_stats() const {
    return {
        cache_hits_.load(std::memory_order_relaxed),
        live_fetches_.load(std::memory_order_relaxed),
        fetch_failures_.load(std::memory_order_relaxed),
        write_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace cdnlocator
