#include "cache/cache_store.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace cdnlocator {

namespace {

constexpr const char* kTimestampField = "Timestamp";
constexpr const char* kRangesField = "IPRanges";

std::atomic<uint64_t> g_temp_counter{0};

} // anonymous namespace

CacheStore::CacheStore(std::string provider_name)
    : CacheStore(std::move(provider_name), Config{}) {}

CacheStore::CacheStore(std::string provider_name, Config config)
    : provider_name_(std::move(provider_name)),
      config_(std::move(config)) {}

std::chrono::system_clock::time_point CacheStore::now() const {
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

std::filesystem::path CacheStore::home_directory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home);
    }
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir);
    }
    return {};
}

std::string CacheStore::file_name(const std::string& provider_name) {
    return std::format(".{}.cdn.ip.range", provider_name);
}

std::filesystem::path CacheStore::path() const {
    const auto dir = config_.directory.empty() ? home_directory() : config_.directory;
    if (dir.empty()) return {};
    return dir / file_name(provider_name_);
}

// ============================================================================
// Read
// ============================================================================

CacheStore::ReadResult CacheStore::read() const {
    ReadResult result;

    const auto file_path = path();
    if (file_path.empty()) {
        result.status = CacheStatus::NOT_FOUND;
        result.error = "cannot determine cache directory";
        return result;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        result.status = CacheStatus::NOT_FOUND;
        result.error = std::format("no cache file at {}", file_path.string());
        return result;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        result.status = CacheStatus::CORRUPT;
        result.error = std::format("invalid cache JSON: {}", e.what());
        return result;
    }

    if (!doc.is_object()) {
        result.status = CacheStatus::CORRUPT;
        result.error = "cache record is not a JSON object";
        return result;
    }

    bool corrupt = false;

    if (const auto it = doc.find(kRangesField); it != doc.end() && !it->is_null()) {
        if (it->is_array()) {
            for (const auto& elem : *it) {
                if (elem.is_string()) {
                    result.ranges.push_back(elem.get<std::string>());
                } else {
                    corrupt = true;
                }
            }
        } else {
            corrupt = true;
        }
    }

    // Missing timestamp decodes as 0 and is therefore stale
    if (const auto it = doc.find(kTimestampField); it != doc.end()) {
        if (it->is_number_unsigned() &&
            it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            corrupt = true;
        } else if (it->is_number_integer()) {
            result.fetched_at = it->get<int64_t>();
        } else {
            corrupt = true;
        }
    }

    if (corrupt) {
        result.status = CacheStatus::CORRUPT;
        result.error = "cache record has fields of the wrong type";
        return result;
    }

    // Compare against a cutoff; now - fetched_at overflows for extreme timestamps
    const int64_t ttl = std::max<int64_t>(config_.ttl.count(), 0);
    const int64_t cutoff = utils::to_unix_seconds(now()) - ttl;
    if (result.fetched_at < cutoff) {
        result.status = CacheStatus::STALE;
        result.error = std::format("cache expired (fetched at {}, ttl {}s)", result.fetched_at, ttl);
        return result;
    }

    result.status = CacheStatus::FRESH;
    return result;
}

// ============================================================================
// Write
// ============================================================================

Result<std::filesystem::path> CacheStore::write(const std::vector<std::string>& ranges) const {
    auto fail = [](std::string message) {
        return Result<std::filesystem::path>::error(ErrorCategory::WRITE_ERROR, std::move(message));
    };

    const auto file_path = path();
    if (file_path.empty()) {
        return fail("cannot determine cache directory");
    }

    std::error_code ec;
    const auto dir = file_path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return fail(std::format("cannot create {}: {}", dir.string(), ec.message()));
        }
    }

    nlohmann::json doc;
    doc[kTimestampField] = utils::to_unix_seconds(now());
    doc[kRangesField] = ranges;
    const std::string payload = doc.dump(1);

    const auto temp_path = std::filesystem::path(std::format("{}.tmp.{}.{}",
        file_path.string(), ::getpid(),
        g_temp_counter.fetch_add(1, std::memory_order_relaxed)));

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return fail(std::format("cannot open {}", temp_path.string()));
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(temp_path, ec);
            return fail(std::format("short write to {}", temp_path.string()));
        }
    }

    std::filesystem::rename(temp_path, file_path, ec);
    if (ec) {
        const auto message = std::format("cannot replace {}: {}", file_path.string(), ec.message());
        std::filesystem::remove(temp_path, ec);
        return fail(message);
    }
    return Result<std::filesystem::path>::ok(file_path);
}

} // namespace cdnlocator
