#pragma once

#include "core/error.hpp"
#include "provider/provider_registry.hpp"
#include "range/ip_address.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace cdnlocator {

/**
 * @brief Concurrent "which CDN owns this IP" query over a provider registry.
 *
 * locate() starts one task per registered provider. Each task runs the
 * provider's cache-first fetch and scans the ranges in order, stopping at
 * the first containing entry. The first provider to report a hit wins; when
 * two providers publish overlapping ranges the winner is whichever finishes
 * first. Provider failures are logged and counted, never surfaced.
 *
 * locate() returns as soon as a hit arrives, every task has finished, or
 * query_timeout elapses. Outstanding tasks are then asked to stop (checked
 * between range entries) and their late results are discarded. Tasks are
 * owned by the engine and joined before it is destroyed.
 *
 * The registry must outlive the engine and must not change while it is used.
 */
class MembershipEngine {
public:
    // Longer timeouts are clamped; larger durations overflow steady_clock deadlines
    static constexpr std::chrono::milliseconds kMaxQueryTimeout{24 * 60 * 60 * 1000};

    struct Config {
        std::chrono::milliseconds query_timeout{30000};  // <= 0: wait for all tasks
    };

    struct Stats {
        uint64_t queries = 0;
        uint64_t matches = 0;
        uint64_t misses = 0;
        uint64_t timeouts = 0;
        uint64_t provider_failures = 0;
    };

    explicit MembershipEngine(const ProviderRegistry& registry);
    MembershipEngine(const ProviderRegistry& registry, Config config);
    ~MembershipEngine();

    MembershipEngine(const MembershipEngine&) = delete;
    MembershipEngine& operator=(const MembershipEngine&) = delete;

    /// Name of the provider owning ip, or nullopt
    [[nodiscard]] std::optional<std::string> locate(const IpAddress& ip);

    /// Unparseable text yields nullopt without starting any task
    [[nodiscard]] std::optional<std::string> locate(std::string_view ip_text);

    [[nodiscard]] std::optional<std::string> lookup(std::string_view ip_text) {
        return locate(ip_text);
    }

    [[nodiscard]] Result<ProviderRegistry::ProviderPtr> get(const std::string& name) const {
        return registry_.get(name);
    }

    /// Cache-or-live ranges for one provider
    [[nodiscard]] Result<std::vector<std::string>> fetch(const std::string& name) const;
    [[nodiscard]] Result<std::vector<std::string>> fetch(
        const ProviderRegistry::ProviderPtr& provider) const;

    /// Live ranges for one provider, bypassing the cache read
    [[nodiscard]] Result<std::vector<std::string>> refresh(const std::string& name) const;

    /**
     * @brief Best-effort cache pre-warm of every provider.
     * @return Number of providers whose fetch succeeded
     */
    size_t warm_all();

    /// Tasks started by earlier queries that have not been joined yet
    [[nodiscard]] size_t pending_tasks() const;

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] std::chrono::milliseconds query_timeout() const { return config_.query_timeout; }

private:
    // Completion barrier shared between one locate() call and its tasks
    struct QueryState {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<std::string> match;
        size_t remaining = 0;
        std::stop_source stop;
    };

    struct Task {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void run_task(const std::string& name,
                  const ProviderRegistry::ProviderPtr& provider,
                  const IpAddress& ip,
                  QueryState& state,
                  std::stop_token thread_stop);

    void reap_finished_tasks();

    const ProviderRegistry& registry_;
    Config config_;

    std::vector<Task> tasks_;
    mutable std::mutex tasks_mutex_;

    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> matches_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> provider_failures_{0};
};

} // namespace cdnlocator
