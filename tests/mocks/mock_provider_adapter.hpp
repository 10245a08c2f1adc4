#pragma once

#include "provider/iprovider_adapter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cdnlocator::testing {

/**
 * @brief Blocks fetches until opened (or until a safety deadline passes)
 */
class Gate {
public:
    void open() {
        {
            std::lock_guard lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait(std::chrono::milliseconds limit = std::chrono::seconds(10)) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, limit, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

/**
 * @brief Scripted provider adapter: fixed ranges or failure, optional delay
 */
class MockProviderAdapter : public IProviderAdapter {
public:
    MockProviderAdapter(std::string name, std::vector<std::string> ranges)
        : name_(std::move(name)), ranges_(std::move(ranges)) {}

    [[nodiscard]] Result<std::vector<std::string>> fetch() override {
        fetch_count_.fetch_add(1, std::memory_order_relaxed);
        if (gate_) gate_->wait();
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (should_fail_) {
            return Result<std::vector<std::string>>::error(
                ErrorCategory::FETCH_ERROR, "Mock failure: " + name_);
        }
        return Result<std::vector<std::string>>::ok(ranges_);
    }

    [[nodiscard]] std::string name() const override { return name_; }

    [[nodiscard]] uint64_t fetch_count() const {
        return fetch_count_.load(std::memory_order_relaxed);
    }

    void set_should_fail(bool v) { should_fail_ = v; }
    void set_ranges(std::vector<std::string> ranges) { ranges_ = std::move(ranges); }
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
    void set_gate(std::shared_ptr<Gate> gate) { gate_ = std::move(gate); }

private:
    std::string name_;
    std::vector<std::string> ranges_;
    bool should_fail_ = false;
    std::chrono::milliseconds delay_{0};
    std::shared_ptr<Gate> gate_;
    std::atomic<uint64_t> fetch_count_{0};
};

} // namespace cdnlocator::testing
