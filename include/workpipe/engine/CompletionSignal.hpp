#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace workpipe {

/**
 * One-shot "done" signal. fire() succeeds exactly once; every waiter,
 * present or future, is released by it.
 *
 * fire() has release semantics and isFired()/wait() acquire semantics, so
 * whatever the firing thread wrote before fire() is visible to a thread
 * that observed the signal.
 */
class CompletionSignal {
public:
    CompletionSignal() = default;

    CompletionSignal(const CompletionSignal&) = delete;
    CompletionSignal& operator=(const CompletionSignal&) = delete;

    /**
     * @return true for the call that fired the signal, false if it was already fired
     */
    bool fire() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fired_.load(std::memory_order_relaxed)) {
                return false;
            }
            fired_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
        return true;
    }

    bool isFired() const { return fired_.load(std::memory_order_acquire); }

    void wait() const {
        if (isFired()) return;
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return fired_.load(std::memory_order_acquire); });
    }

    template<typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        if (isFired()) return true;
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return fired_.load(std::memory_order_acquire); });
    }

private:
    std::atomic<bool> fired_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace workpipe
