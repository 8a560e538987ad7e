#pragma once

#include "workpipe/util/BlockingQueue.hpp"
#include "workpipe/worker/WorkerHandle.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace workpipe {

/**
 * Ready-made worker backed by a bounded queue of capacity max(1, min_threads).
 *
 * Producers call injectRequest(); the pool's pipes pull with
 * provideRequest() in FIFO order. Activation and drain notifications only
 * maintain the two counters.
 */
template<typename P = std::any, typename R = std::any>
class DefaultWorker : public TypedWorkerHandle<P, R> {
public:
    using Request = WorkRequest<P, R>;

    DefaultWorker(std::string name, std::string file_name, int min_threads, Environment env = {})
        : name_(std::move(name)),
          file_name_(std::move(file_name)),
          env_(std::move(env)),
          min_threads_(min_threads),
          queue_(static_cast<size_t>(std::max(1, min_threads))) {}

    std::string name() const override { return name_; }
    std::string fileName() const override { return file_name_; }
    Environment env() const override { return env_; }
    int minThreads() const override { return min_threads_; }

    void threadActivated(int) override {
        activated_count_.fetch_add(1, std::memory_order_acq_rel);
    }

    void threadDraining(int) override {
        drain_count_.fetch_add(1, std::memory_order_acq_rel);
    }

    // Undoes both markers, whether or not a drain was announced
    void threadDeactivated(int) override {
        drain_count_.fetch_sub(1, std::memory_order_acq_rel);
        activated_count_.fetch_sub(1, std::memory_order_acq_rel);
    }

    std::unique_ptr<Request> provideRequest(std::stop_token stop) override {
        std::unique_ptr<Request> rq;
        if (!queue_.dequeue(rq, stop)) {
            return nullptr;
        }
        if (!rq) {
            // A null injection is an empty invocation, not a stop
            rq = std::make_unique<Request>();
        }
        return rq;
    }

    /**
     * Queue a request for the worker script. Blocks while the queue is full.
     * @return false if the worker was closed
     */
    bool injectRequest(std::unique_ptr<Request> rq) {
        return queue_.enqueue(std::move(rq));
    }

    /**
     * Non-blocking variant of injectRequest().
     * @return false if the queue is full or the worker was closed
     */
    bool tryInjectRequest(std::unique_ptr<Request>& rq) {
        return queue_.try_enqueue(std::move(rq));
    }

    // Wakes blocked producers and consumers; no further requests are accepted
    void close() { queue_.shutdown(); }

    int32_t activatedCount() const { return activated_count_.load(std::memory_order_acquire); }
    int32_t drainingCount() const { return drain_count_.load(std::memory_order_acquire); }
    size_t queuedRequests() const { return queue_.size(); }

private:
    std::string name_;
    std::string file_name_;
    Environment env_;
    int min_threads_;
    BlockingQueue<std::unique_ptr<Request>> queue_;
    std::atomic<int32_t> activated_count_{0};
    std::atomic<int32_t> drain_count_{0};
};

} // namespace workpipe
