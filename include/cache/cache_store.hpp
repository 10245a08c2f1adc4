#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace cdnlocator {

enum class CacheStatus : uint8_t {
    FRESH,
    NOT_FOUND,
    CORRUPT,
    STALE
};

[[nodiscard]] inline const char* cache_status_to_string(CacheStatus status) {
    switch (status) {
        case CacheStatus::FRESH:     return "fresh";
        case CacheStatus::NOT_FOUND: return "not_found";
        case CacheStatus::CORRUPT:   return "corrupt";
        case CacheStatus::STALE:     return "stale";
        default:                     return "unknown";
    }
}

/**
 * @brief Single-file snapshot of one provider's published ranges
 *
 * File: <directory>/.<provider>.cdn.ip.range containing
 *   {"Timestamp": <unix seconds>, "IPRanges": ["...", ...]}
 *
 * Writes go to a sibling temp file which is then renamed over the target,
 * so concurrent readers observe either the old or the new snapshot.
 */
class CacheStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultTtl{7 * 24 * 60 * 60};

    struct Config {
        std::filesystem::path directory;        // empty = user's home directory
        std::chrono::seconds ttl = kDefaultTtl;
        Clock clock;                             // empty = system_clock::now
    };

    struct ReadResult {
        std::vector<std::string> ranges;
        CacheStatus status = CacheStatus::NOT_FOUND;
        std::string error;
        int64_t fetched_at = 0;

        [[nodiscard]] bool usable() const {
            return status == CacheStatus::FRESH && !ranges.empty();
        }
    };

    explicit CacheStore(std::string provider_name);
    CacheStore(std::string provider_name, Config config);

    /**
     * @brief Load the snapshot and judge its freshness.
     *
     * On any status other than FRESH the ranges hold whatever could be
     * decoded and must not be trusted.
     */
    [[nodiscard]] ReadResult read() const;

    /**
     * @brief Persist ranges stamped with the current time.
     * @return Path written, or WRITE_ERROR on I/O failure
     */
    [[nodiscard]] Result<std::filesystem::path> write(const std::vector<std::string>& ranges) const;

    /// Snapshot location; empty when no directory can be determined
    [[nodiscard]] std::filesystem::path path() const;

    [[nodiscard]] const std::string& provider_name() const { return provider_name_; }
    [[nodiscard]] std::chrono::seconds ttl() const { return config_.ttl; }

    /// User's home directory ($HOME, else the password database)
    [[nodiscard]] static std::filesystem::path home_directory();

    [[nodiscard]] static std::string file_name(const std::string& provider_name);

private:
    [[nodiscard]] std::chrono::system_clock::time_point now() const;

    std::string provider_name_;
    Config config_;
};

} // namespace cdnlocator
