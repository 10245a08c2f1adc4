#pragma once

#include "cache/cache_store.hpp"
#include "provider/http_provider_adapter.hpp"
#include "provider/provider_registry.hpp"

#include <vector>

namespace cdnlocator {

namespace providers {
inline constexpr const char* AKAMAI     = "akamai";
inline constexpr const char* BUNNY      = "bunny";
inline constexpr const char* CACHEFLY   = "cachefly";
inline constexpr const char* CLOUDFLARE = "cloudflare";
inline constexpr const char* CLOUDFRONT = "cloudfront";
inline constexpr const char* FASTLY     = "fastly";
inline constexpr const char* GCORE      = "gcore";
inline constexpr const char* GOOGLE     = "google";
inline constexpr const char* KEYCDN     = "key";
inline constexpr const char* QUIC       = "quic";
} // namespace providers

/// Endpoints and formats of the CDNs known out of the box
[[nodiscard]] std::vector<HttpProviderAdapter::Config> builtin_provider_configs(
    const HttpSettings& http = {});

/**
 * @brief Wrap each adapter config in a CachedProvider and register it.
 *
 * A later config with the same name replaces an earlier one. The registry
 * is left unsealed.
 */
void register_http_providers(ProviderRegistry& registry,
                             const std::vector<HttpProviderAdapter::Config>& configs,
                             const CacheStore::Config& cache_config);

} // namespace cdnlocator
