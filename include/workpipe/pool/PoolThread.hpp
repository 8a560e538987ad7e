#pragma once

#include "workpipe/engine/ExecutionEngine.hpp"
#include "workpipe/engine/ScriptWorker.hpp"
#include "workpipe/pipe/CompletionPool.hpp"
#include "workpipe/pipe/PipeLoop.hpp"
#include "workpipe/pool/ThreadStateMachine.hpp"
#include "workpipe/worker/WorkerHandle.hpp"
#include <memory>
#include <stop_token>
#include <thread>

namespace workpipe {

/**
 * One slot of the thread budget.
 *
 * While active, a slot owns two threads for its worker: the engine thread
 * running the worker script against the dispatch channel, and the pipe
 * thread running the PipeLoop that feeds it. Both observe the same stop
 * token, so drain() stops and joins them together.
 */
class PoolThread {
public:
    explicit PoolThread(int thread_id);
    ~PoolThread();

    // Non-copyable, non-movable
    PoolThread(const PoolThread&) = delete;
    PoolThread& operator=(const PoolThread&) = delete;

    /**
     * Assign the slot to a worker: notify threadActivated(), then start the
     * engine and pipe threads.
     * @return false if the slot is already active
     */
    bool activate(std::shared_ptr<WorkerHandle> handle, ScriptWorker& worker,
                  std::shared_ptr<ExecutionEngine> engine, CompletionPool& completions);

    /**
     * Return the slot to the pool: notify threadDraining(), stop and join
     * both threads, then notify threadDeactivated().
     * @return false if the slot was not active
     */
    bool drain();

    int getThreadId() const { return thread_id_; }
    ThreadStateMachine::State getState() const { return state_.getState(); }
    bool isActive() const { return state_.getState() == ThreadStateMachine::State::ACTIVE; }

    // Worker the slot is assigned to; null while inactive
    std::shared_ptr<WorkerHandle> handle() const { return handle_; }

    // Requests the pipe thread has handed to the engine during this assignment
    uint64_t dispatchedCount() const;

private:
    void notify(void (WorkerHandle::*hook)(int), const char* hook_name);

    int thread_id_;
    ThreadStateMachine state_;
    std::shared_ptr<WorkerHandle> handle_;
    std::shared_ptr<ExecutionEngine> engine_;
    std::unique_ptr<PipeLoop> pipe_;
    std::stop_source stop_source_;
    std::thread engine_thread_;
    std::thread pipe_thread_;
};

} // namespace workpipe
