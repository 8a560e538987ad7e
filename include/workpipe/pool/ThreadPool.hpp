#pragma once

#include "workpipe/Config.hpp"
#include "workpipe/engine/ExecutionEngine.hpp"
#include "workpipe/engine/ScriptWorker.hpp"
#include "workpipe/pipe/CompletionPool.hpp"
#include "workpipe/pool/PoolThread.hpp"
#include "workpipe/worker/WorkerRegistry.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace workpipe {

/**
 * Fixed budget of threads shared by every registered worker.
 *
 * start() snapshots the registry, checks that the workers' minThreads()
 * reservations fit in the budget and activates the reserved threads.
 * Remaining slots stay inactive until activateThread() assigns them.
 *
 * Example:
 * ```cpp
 * auto worker = std::make_shared<DefaultWorker<>>("mailer", "/app/mailer.php", 2);
 * WorkerRegistry registry;
 * registry.registerWorker(worker);
 *
 * ThreadPool pool(PoolConfig{4}, registry, engine);
 * pool.start();                  // 2 threads active for "mailer"
 * pool.activateThread("mailer"); // 3 threads
 * pool.stop();
 * ```
 */
class ThreadPool {
public:
    ThreadPool(PoolConfig config, WorkerRegistry& registry, std::shared_ptr<ExecutionEngine> engine);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @throws ThreadReservationError if the reservations exceed the budget;
     *         no thread is started in that case
     * @throws std::invalid_argument on an invalid config
     * @throws std::logic_error if already started, including a pool that
     *         has since been stopped
     */
    void start();

    /**
     * Drain every active thread, shut down the dispatch channels and the
     * completion pool. Idempotent. A stopped pool cannot be started again.
     */
    void stop();

    /**
     * Assign an inactive slot to the named worker.
     * @return the thread id, or nullopt if the worker is unknown or no slot is free
     */
    std::optional<int> activateThread(const std::string& worker_name);

    // @return false if the id is unknown or the thread is not active
    bool drainThread(int thread_id);

    size_t numThreads() const;
    size_t activeThreads() const;
    size_t activeThreadsFor(const std::string& worker_name) const;
    bool isRunning() const;

    const PoolConfig& config() const { return config_; }

private:
    std::optional<int> activateLocked(const std::shared_ptr<WorkerHandle>& handle);

    PoolConfig config_;
    WorkerRegistry& registry_;
    std::shared_ptr<ExecutionEngine> engine_;

    mutable std::mutex mutex_;
    bool running_ = false;
    bool started_ = false;
    std::unique_ptr<CompletionPool> completions_;
    std::map<std::string, std::shared_ptr<WorkerHandle>> handles_;
    std::map<std::string, std::unique_ptr<ScriptWorker>> script_workers_;
    std::vector<std::unique_ptr<PoolThread>> threads_;
};

} // namespace workpipe
