#pragma once

#include "workpipe/engine/ScriptWorker.hpp"
#include "workpipe/pipe/CompletionPool.hpp"
#include "workpipe/worker/WorkerHandle.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>

namespace workpipe {

/**
 * Moves work from a worker handle into its script's dispatch channel.
 *
 * One PipeLoop runs per activated thread. Each iteration asks the handle
 * for work, adapts it into a RequestContext, arranges for the caller's
 * completion callback and hands the context to the engine. A malformed
 * request is logged and skipped; the loop only ends when stop is requested.
 *
 * A handle that throws from provide is retried after a delay that doubles
 * with each consecutive failure, from 10ms up to 1s. The delay is cut short
 * by stop.
 */
class PipeLoop {
public:
    PipeLoop(std::shared_ptr<WorkerHandle> handle, ScriptWorker& worker, CompletionPool& completions, int thread_id);

    // Loop until stop is requested
    void run(std::stop_token stop);

    /**
     * One provide -> adapt -> dispatch round.
     * @return false when the handle reported stop
     */
    bool runOnce(std::stop_token stop);

    int threadId() const { return thread_id_; }
    uint64_t dispatchedCount() const { return dispatched_.load(std::memory_order_relaxed); }
    uint64_t droppedCount() const { return dropped_.load(std::memory_order_relaxed); }
    uint32_t consecutiveProvideFailures() const { return provide_failures_.load(std::memory_order_relaxed); }

private:
    void backoff(std::stop_token stop, uint32_t failures);

    std::shared_ptr<WorkerHandle> handle_;
    ScriptWorker& worker_;
    CompletionPool& completions_;
    int thread_id_;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint32_t> provide_failures_{0};

    std::mutex backoff_mutex_;
    std::condition_variable_any backoff_cv_;
};

} // namespace workpipe
