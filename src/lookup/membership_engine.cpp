#include "lookup/membership_engine.hpp"
#include "range/range_entry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <system_error>

namespace cdnlocator {

MembershipEngine::MembershipEngine(const ProviderRegistry& registry)
    : MembershipEngine(registry, Config{}) {}

MembershipEngine::MembershipEngine(const ProviderRegistry& registry, Config config)
    : registry_(registry),
      config_(config) {
    if (config_.query_timeout > kMaxQueryTimeout) {
        utils::log::warn(std::format("query_timeout {}ms exceeds the {}ms limit; clamping",
            config_.query_timeout.count(), kMaxQueryTimeout.count()));
        config_.query_timeout = kMaxQueryTimeout;
    }
}

MembershipEngine::~MembershipEngine() {
    std::lock_guard lock(tasks_mutex_);
    for (auto& task : tasks_) {
        task.thread.request_stop();
    }
    tasks_.clear();  // jthread joins
}

// ============================================================================
// Fan-out Query
// ============================================================================

std::optional<std::string> MembershipEngine::locate(std::string_view ip_text) {
    const auto ip = IpAddress::parse(ip_text);
    if (!ip) {
        queries_.fetch_add(1, std::memory_order_relaxed);
        misses_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("Not an IP address: '{}'", ip_text));
        return std::nullopt;
    }
    return locate(*ip);
}

std::optional<std::string> MembershipEngine::locate(const IpAddress& ip) {
    queries_.fetch_add(1, std::memory_order_relaxed);
    reap_finished_tasks();

    const auto& providers = registry_.all();
    if (providers.empty()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto state = std::make_shared<QueryState>();
    state->remaining = providers.size();

    size_t launched = 0;
    try {
        std::lock_guard lock(tasks_mutex_);
        tasks_.reserve(tasks_.size() + providers.size());
        for (const auto& [name, provider] : providers) {
            auto finished = std::make_shared<std::atomic<bool>>(false);
            // Captures by value: the task may outlive this call
            tasks_.push_back(Task{
                std::jthread([this, name, provider, ip, state, finished](std::stop_token st) {
                    run_task(name, provider, ip, *state, st);
                    finished->store(true, std::memory_order_release);
                }),
                finished
            });
            ++launched;
        }
    } catch (const std::system_error& e) {
        utils::log::error(std::format("Could only start {} of {} provider tasks: {}",
            launched, providers.size(), e.what()));
        std::lock_guard lock(state->mutex);
        state->remaining -= providers.size() - launched;
    }

    std::optional<std::string> result;
    bool completed = true;
    {
        std::unique_lock lock(state->mutex);
        const auto ready = [&state] {
            return state->match.has_value() || state->remaining == 0;
        };
        if (config_.query_timeout.count() > 0) {
            completed = state->cv.wait_for(lock, config_.query_timeout, ready);
        } else {
            state->cv.wait(lock, ready);
        }
        result = state->match;
    }

    // Losers and stragglers stop at their next check; results are discarded
    state->stop.request_stop();

    if (!completed) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Lookup of {} timed out after {}ms",
            ip.to_string(), config_.query_timeout.count()));
    }

    if (result) {
        matches_.fetch_add(1, std::memory_order_relaxed);
        utils::log::debug(std::format("{} belongs to {}", ip.to_string(), *result));
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

void MembershipEngine::run_task(const std::string& name,
                                const ProviderRegistry::ProviderPtr& provider,
                                const IpAddress& ip,
                                QueryState& state,
                                std::stop_token thread_stop) {
    // Engine shutdown cancels the query too
    std::stop_callback on_shutdown(thread_stop, [&state] { state.stop.request_stop(); });
    const auto stop = state.stop.get_token();

    bool hit = false;
    if (!stop.stop_requested()) {
        try {
            const auto ranges = provider->fetch_with_cache();
            if (ranges.is_error()) {
                provider_failures_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("[{}] fetch failed: {}", name, ranges.error_message()));
            } else {
                hit = RangeEntry::find_match(ranges.value(), ip, stop).has_value();
            }
        } catch (const std::exception& e) {
            provider_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("[{}] lookup task failed: {}", name, e.what()));
        }
    }

    {
        std::lock_guard lock(state.mutex);
        if (hit && !state.match) {
            state.match = name;
        }
        --state.remaining;
    }
    state.cv.notify_all();
}

void MembershipEngine::reap_finished_tasks() {
    std::lock_guard lock(tasks_mutex_);
    std::erase_if(tasks_, [](const Task& task) {
        return task.finished->load(std::memory_order_acquire);
    });
}

size_t MembershipEngine::pending_tasks() const {
    std::lock_guard lock(tasks_mutex_);
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [](const Task& task) { return !task.finished->load(std::memory_order_acquire); }));
}

// ============================================================================
// Single-provider Operations
// ============================================================================

Result<std::vector<std::string>> MembershipEngine::fetch(const std::string& name) const {
    auto provider = registry_.get(name);
    if (provider.is_error()) {
        return Result<std::vector<std::string>>::error(
            provider.error_category(), provider.error_message());
    }
    return fetch(provider.value());
}

Result<std::vector<std::string>> MembershipEngine::fetch(
    const ProviderRegistry::ProviderPtr& provider) const {
    if (!provider) {
        return Result<std::vector<std::string>>::error(
            ErrorCategory::INTERNAL_ERROR, "fetch called with a null provider");
    }
    return provider->fetch_with_cache();
}

Result<std::vector<std::string>> MembershipEngine::refresh(const std::string& name) const {
    auto provider = registry_.get(name);
    if (provider.is_error()) {
        return Result<std::vector<std::string>>::error(
            provider.error_category(), provider.error_message());
    }
    return provider.value()->fetch_live();
}

size_t MembershipEngine::warm_all() {
    size_t warmed = 0;
    for (const auto& [name, provider] : registry_.all()) {
        const auto ranges = provider->fetch_with_cache();
        if (ranges.is_error()) {
            provider_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("[{}] pre-warm failed: {}", name, ranges.error_message()));
            continue;
        }
        utils::log::info(std::format("[{}] {} ranges ready", name, ranges.value().size()));
        ++warmed;
    }
    return warmed;
}

MembershipEngine::Stats MembershipEngine::get_stats() const {
    return {
        queries_.load(std::memory_order_relaxed),
        matches_.load(std::memory_order_relaxed),
        misses_.load(std::memory_order_relaxed),
        timeouts_.load(std::memory_order_relaxed),
        provider_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace cdnlocator
