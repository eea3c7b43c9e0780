#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lumen::sched {

/**
 * @brief A sleep that other threads can cut short.
 *
 * Each stop request raises a counter; while any request is outstanding every
 * current and future waitFor() returns false immediately. A request is only
 * withdrawn by the party that raised it, so a waiter can never clear someone
 * else's interrupt.
 */
class InterruptibleWait {
public:
    /// Block for @p timeout. Returns true if the full time elapsed, false if interrupted.
    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(m);
        return !cv.wait_for(lk, timeout, [this]{ return pendingStops > 0; });
    }

    void interrupt() {
        {
            std::lock_guard<std::mutex> lk(m);
            ++pendingStops;
        }
        cv.notify_all();
    }

    /// Withdraw one earlier interrupt().
    void release() {
        std::lock_guard<std::mutex> lk(m);
        if (pendingStops > 0) {
            --pendingStops;
        }
    }

    bool isInterrupted() const {
        std::lock_guard<std::mutex> lk(m);
        return pendingStops > 0;
    }

private:
    mutable std::mutex m;
    std::condition_variable cv;
    unsigned pendingStops = 0;
};

/// Holds one interrupt on an InterruptibleWait for the lifetime of the scope.
class StopRequest {
public:
    explicit StopRequest(InterruptibleWait& wait) : target(wait) { target.interrupt(); }
    ~StopRequest() { target.release(); }

    StopRequest(const StopRequest&) = delete;
    StopRequest& operator=(const StopRequest&) = delete;

private:
    InterruptibleWait& target;
};

} // namespace lumen::sched
