#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cdnlocator {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Cache Config
// ============================================================================

struct CacheConfig {
    std::string directory;                      // empty = home directory
    int64_t ttl_seconds = 7 * 24 * 60 * 60;
};

// ============================================================================
// Lookup Config
// ============================================================================

struct LookupConfig {
    int64_t query_timeout_ms = 30000;          // 0 = wait for every provider
};

// ============================================================================
// HTTP Client Config
// ============================================================================

struct HttpConfig {
    int64_t connect_timeout_ms = 10000;
    int64_t read_timeout_ms = 30000;
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/58.0.3029.110 Safari/537.3";
};

// ============================================================================
// Provider Config
// ============================================================================

struct BuiltinProvidersConfig {
    bool enabled = true;
    std::vector<std::string> exclude;
};

// [[providers]] entry; a name matching a built-in replaces it
struct ProviderConfig {
    std::string name;
    std::string url;
    std::string format = "lines";
    std::string field;
    std::string member;
    std::string delimiter = "\n";
    std::string selector;
    int64_t index = 0;
};

// ============================================================================
// Top-level Config
// ============================================================================

struct LocatorConfig {
    LoggingConfig logging;
    CacheConfig cache;
    LookupConfig lookup;
    HttpConfig http;
    BuiltinProvidersConfig builtin_providers;
    std::vector<ProviderConfig> providers;
};

} // namespace cdnlocator
