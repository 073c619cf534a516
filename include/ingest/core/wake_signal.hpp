#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace ingest {

/**
 * @brief Interruptible sleep: timer, wake-up and stop, whichever fires first
 *
 * A wake-up that arrives while nobody waits is remembered and consumed by
 * the next wait, so a configuration change posted between two scans is
 * never lost.
 */
class WakeSignal {
public:
    enum class Reason {
        Timeout,
        Woken,
        Stopped
    };

    template<typename Rep, typename Period>
    Reason wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        const bool fired = cv_.wait_for(lock, timeout, [this]() {
            return stopped_ || pending_wakeups_ > 0;
        });
        if (stopped_) {
            return Reason::Stopped;
        }
        if (!fired) {
            return Reason::Timeout;
        }
        pending_wakeups_ = 0;
        return Reason::Woken;
    }

    void wake() {
        {
            std::lock_guard lock(mutex_);
            ++pending_wakeups_;
        }
        cv_.notify_all();
    }

    void stop() {
        {
            std::lock_guard lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard lock(mutex_);
        stopped_ = false;
        pending_wakeups_ = 0;
    }

    bool stopped() const {
        std::lock_guard lock(mutex_);
        return stopped_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t pending_wakeups_ = 0;
    bool stopped_ = false;
};

} // namespace ingest
