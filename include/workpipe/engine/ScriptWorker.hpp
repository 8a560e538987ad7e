#pragma once

#include "workpipe/engine/ExecutionEngine.hpp"
#include "workpipe/engine/RequestContext.hpp"
#include "workpipe/util/BlockingQueue.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <stop_token>

namespace workpipe {

/**
 * Pool-side record of one registered worker script: its binding and the
 * dispatch channel between the pipe loops (producers) and the engine
 * threads (consumers) assigned to it.
 */
class ScriptWorker {
public:
    ScriptWorker(ScriptBinding binding, size_t dispatch_capacity);

    ScriptWorker(const ScriptWorker&) = delete;
    ScriptWorker& operator=(const ScriptWorker&) = delete;

    const ScriptBinding& binding() const { return binding_; }
    const std::string& name() const { return binding_.worker_name; }

    /**
     * Hand a context to the engine. Blocks while the channel is full.
     * @return false if stop was requested or the channel is shut down;
     *         the context was not dispatched in that case
     */
    bool dispatch(std::shared_ptr<RequestContext> context, std::stop_token stop);

    /**
     * Engine thread body: run dispatched contexts until stop is requested
     * or the channel is shut down. A context already taken when stop fires
     * still runs; anything left in the channel is served by other threads.
     */
    void serve(ExecutionEngine& engine, int thread_id, std::stop_token stop);

    // Wakes every engine thread and pipe loop blocked on the channel
    void shutdown();

    size_t pending() const { return channel_.size(); }
    uint64_t executedCount() const { return executed_.load(std::memory_order_relaxed); }

private:
    void run(ExecutionEngine& engine, RequestContext& context, int thread_id);

    ScriptBinding binding_;
    BlockingQueue<std::shared_ptr<RequestContext>> channel_;
    std::atomic<uint64_t> executed_{0};
};

} // namespace workpipe
