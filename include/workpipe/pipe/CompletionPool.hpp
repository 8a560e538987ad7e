#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace workpipe {

// Fixed set of threads that run completion callbacks off the engine threads
class CompletionPool {
public:
    explicit CompletionPool(size_t num_threads = 2);
    ~CompletionPool();

    CompletionPool(const CompletionPool&) = delete;
    CompletionPool& operator=(const CompletionPool&) = delete;

    /**
     * Queue a callback. Returns false (and drops the callback) once
     * shutdown() has been called.
     */
    bool post(std::function<void()> task);

    /**
     * Stop accepting callbacks, run the ones already queued and join the
     * threads. Must not be called from a callback.
     */
    void shutdown();

    size_t threadCount() const { return workers_.size(); }

private:
    void worker_thread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace workpipe
