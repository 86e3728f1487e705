/**
 * @file settle_once.hpp
 * @brief Single-completion result slot shared by racing producers.
 *
 * @copyright Copyright (c) 2024 LanScope Contributors
 * @license MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace lanscope {
namespace core {

/**
 * @class SettleOnce
 * @brief Holds the first of several competing results.
 *
 * Producers (a process watcher and a timer, or a network answer and a
 * deadline) all call settle(); the atomic flag is checked-and-set
 * before the value is stored, so exactly one call returns true and
 * later calls are no-ops. Consumers block in wait()/waitFor().
 *
 * @code
 * auto slot = std::make_shared<SettleOnce<std::string>>();
 * std::thread([slot] { slot->settle(readAll()); }).detach();
 * if (auto v = slot->waitFor(timeout)) return *v;
 * if (slot->settle("timed out")) killChild();
 * return slot->wait();
 * @endcode
 */
template <typename T>
class SettleOnce {
public:
    SettleOnce() = default;

    SettleOnce(const SettleOnce&) = delete;
    SettleOnce& operator=(const SettleOnce&) = delete;

    /**
     * @return True if this call delivered the result.
     */
    bool settle(T value) {
        bool expected = false;
        if (!settled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value_ = std::move(value);
        }
        cv_.notify_all();
        return true;
    }

    bool isSettled() const {
        return settled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Wait up to timeout for the result.
     */
    template <typename Rep, typename Period>
    std::optional<T> waitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return value_.has_value(); })) {
            return std::nullopt;
        }
        return value_;
    }

    T wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return value_.has_value(); });
        return *value_;
    }

private:
    std::atomic<bool> settled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
};

}  // namespace core
}  // namespace lanscope
