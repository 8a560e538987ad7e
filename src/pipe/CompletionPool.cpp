#include "workpipe/pipe/CompletionPool.hpp"
#include "workpipe/logger/Logger.hpp"

namespace workpipe {

CompletionPool::CompletionPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&CompletionPool::worker_thread, this);
    }
}

CompletionPool::~CompletionPool() {
    shutdown();
}

bool CompletionPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) return false;
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void CompletionPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void CompletionPool::worker_thread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                break;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (!task) continue;

        try {
            task();
        } catch (...) {
            Logger::getInstance().logCurrentError("completion callback threw");
        }
    }
}

} // namespace workpipe
