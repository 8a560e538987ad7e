#include "workpipe/pool/ThreadPool.hpp"
#include "workpipe/Errors.hpp"
#include "workpipe/logger/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace workpipe {

ThreadPool::ThreadPool(PoolConfig config, WorkerRegistry& registry, std::shared_ptr<ExecutionEngine> engine)
    : config_(config), registry_(registry), engine_(std::move(engine)) {
    if (!engine_) {
        throw std::invalid_argument("ThreadPool requires an execution engine");
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        throw std::logic_error("ThreadPool already started");
    }
    if (started_) {
        // The dispatch channels were shut down by stop()
        throw std::logic_error("ThreadPool cannot be restarted after stop");
    }
    config_.validate();

    std::vector<std::shared_ptr<WorkerHandle>> handles = registry_.snapshot();
    size_t budget = config_.resolvedThreads();

    size_t demand = 0;
    std::string reservations;
    for (const auto& handle : handles) {
        int reserved = std::max(0, handle->minThreads());
        demand += static_cast<size_t>(reserved);
        reservations += " " + handle->name() + "=" + std::to_string(reserved);
    }
    if (demand > budget) {
        throw ThreadReservationError("workers reserve " + std::to_string(demand) + " threads but only " +
                                         std::to_string(budget) + " are available:" + reservations,
                                     demand, budget);
    }

    completions_ = std::make_unique<CompletionPool>(config_.resolvedCompletionThreads());
    for (const auto& handle : handles) {
        ScriptBinding binding{handle->name(), handle->fileName(), handle->env()};
        size_t capacity = config_.resolvedDispatchCapacity(handle->minThreads());
        script_workers_.emplace(handle->name(), std::make_unique<ScriptWorker>(std::move(binding), capacity));
        handles_.emplace(handle->name(), handle);
    }
    threads_.reserve(budget);
    for (size_t i = 0; i < budget; ++i) {
        threads_.push_back(std::make_unique<PoolThread>(static_cast<int>(i)));
    }
    running_ = true;
    started_ = true;

    for (const auto& handle : handles) {
        int reserved = handle->minThreads();
        if (reserved <= 0) {
            Logger::getInstance().logWarning(LogLine("worker reserves no threads and may starve")
                                                 .with("worker", handle->name()));
            continue;
        }
        for (int i = 0; i < reserved; ++i) {
            activateLocked(handle);
        }
    }

    Logger::getInstance().logMessage(LogLine("thread pool started")
                                         .with("threads", budget)
                                         .with("reserved", demand)
                                         .with("workers", handles.size()));
}

void ThreadPool::stop() {
    CompletionPool* completions = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;

        for (auto& thread : threads_) {
            thread->drain();
        }
        for (auto& entry : script_workers_) {
            entry.second->shutdown();
        }
        completions = completions_.get();
    }

    // Queued callbacks may query the pool, so run them without holding the lock
    completions->shutdown();
    Logger::getInstance().logMessage("thread pool stopped");
}

std::optional<int> ThreadPool::activateThread(const std::string& worker_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return std::nullopt;
    }
    auto it = handles_.find(worker_name);
    if (it == handles_.end()) {
        Logger::getInstance().logWarning(LogLine("cannot activate a thread for an unknown worker")
                                             .with("worker", worker_name));
        return std::nullopt;
    }
    return activateLocked(it->second);
}

std::optional<int> ThreadPool::activateLocked(const std::shared_ptr<WorkerHandle>& handle) {
    ScriptWorker& worker = *script_workers_.at(handle->name());
    for (auto& thread : threads_) {
        if (thread->getState() != ThreadStateMachine::State::INACTIVE) {
            continue;
        }
        if (thread->activate(handle, worker, engine_, *completions_)) {
            return thread->getThreadId();
        }
    }
    Logger::getInstance().logWarning(LogLine("no free thread to activate").with("worker", handle->name()));
    return std::nullopt;
}

bool ThreadPool::drainThread(int thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_id < 0 || static_cast<size_t>(thread_id) >= threads_.size()) {
        return false;
    }
    return threads_[static_cast<size_t>(thread_id)]->drain();
}

size_t ThreadPool::numThreads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.size();
}

size_t ThreadPool::activeThreads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(threads_.begin(), threads_.end(),
                                             [](const auto& thread) { return thread->isActive(); }));
}

size_t ThreadPool::activeThreadsFor(const std::string& worker_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& thread : threads_) {
        auto handle = thread->handle();
        if (thread->isActive() && handle && handle->name() == worker_name) {
            ++count;
        }
    }
    return count;
}

bool ThreadPool::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace workpipe
