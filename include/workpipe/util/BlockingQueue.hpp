#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <utility>

namespace workpipe {

/**
 * Bounded multi-producer/multi-consumer queue with blocking on both ends.
 *
 * - enqueue() blocks while the queue is full (back-pressure, never drops)
 * - dequeue() blocks while the queue is empty
 * - the std::stop_token overloads additionally return false as soon as
 *   stop is requested on the token
 * - shutdown() wakes everybody; blocking calls return false afterwards,
 *   try_dequeue() can still drain what is left
 *
 * An item passed to a failed enqueue is left untouched.
 *
 * @param T - Type of elements stored in the queue (movable)
 */
template<typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(size_t capacity) : capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("BlockingQueue capacity must be positive");
        }
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * Enqueue an item, waiting for free space.
     * @return true if enqueued, false if the queue was shut down
     */
    bool enqueue(T&& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return shutdown_ || items_.size() < capacity_; });
        return push_locked(lock, std::move(item));
    }

    /**
     * Enqueue an item, waiting for free space until stop is requested.
     * @return true if enqueued, false on shutdown or stop request
     */
    bool enqueue(T&& item, std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait(lock, stop, [this] { return shutdown_ || items_.size() < capacity_; })) {
            return false; // stop requested while full
        }
        return push_locked(lock, std::move(item));
    }

    /**
     * Non-blocking enqueue.
     * @return true if enqueued, false if full or shut down
     */
    bool try_enqueue(T&& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (items_.size() >= capacity_) {
            return false;
        }
        return push_locked(lock, std::move(item));
    }

    /**
     * Dequeue an item, waiting for one to arrive.
     * @return true if dequeued, false if the queue was shut down
     */
    bool dequeue(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return shutdown_ || !items_.empty(); });
        return pop_locked(lock, item);
    }

    /**
     * Dequeue an item, waiting until one arrives or stop is requested.
     * @return true if dequeued, false on shutdown or stop request
     */
    bool dequeue(T& item, std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait(lock, stop, [this] { return shutdown_ || !items_.empty(); })) {
            return false;
        }
        return pop_locked(lock, item);
    }

    /**
     * Non-blocking dequeue. Keeps working after shutdown so callers can drain.
     */
    bool try_dequeue(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    /**
     * Signal shutdown to all waiting producers and consumers.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    bool push_locked(std::unique_lock<std::mutex>& lock, T&& item) {
        if (shutdown_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool pop_locked(std::unique_lock<std::mutex>& lock, T& item) {
        if (shutdown_) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    const size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    bool shutdown_ = false;
};

} // namespace workpipe
