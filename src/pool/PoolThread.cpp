#include "workpipe/pool/PoolThread.hpp"
#include "workpipe/logger/Logger.hpp"

namespace workpipe {

PoolThread::PoolThread(int thread_id) : thread_id_(thread_id) {}

PoolThread::~PoolThread() {
    drain();
}

bool PoolThread::activate(std::shared_ptr<WorkerHandle> handle, ScriptWorker& worker,
                          std::shared_ptr<ExecutionEngine> engine, CompletionPool& completions) {
    if (!state_.tryActivate()) {
        return false;
    }

    handle_ = std::move(handle);
    engine_ = std::move(engine);
    stop_source_ = std::stop_source();
    pipe_ = std::make_unique<PipeLoop>(handle_, worker, completions, thread_id_);

    notify(&WorkerHandle::threadActivated, "threadActivated");

    std::stop_token token = stop_source_.get_token();
    engine_thread_ = std::thread([this, &worker, token] {
        worker.serve(*engine_, thread_id_, token);
    });
    pipe_thread_ = std::thread([this, token] {
        pipe_->run(token);
    });

    Logger::getInstance().logMessage(LogLine("thread activated")
                                         .with("worker", worker.name())
                                         .with("thread", thread_id_));
    return true;
}

bool PoolThread::drain() {
    if (!state_.tryDrain()) {
        return false;
    }

    notify(&WorkerHandle::threadDraining, "threadDraining");

    stop_source_.request_stop();
    if (pipe_thread_.joinable()) {
        pipe_thread_.join();
    }
    if (engine_thread_.joinable()) {
        engine_thread_.join();
    }

    state_.tryDeactivate();
    notify(&WorkerHandle::threadDeactivated, "threadDeactivated");

    Logger::getInstance().logMessage(LogLine("thread deactivated")
                                         .with("worker", handle_->name())
                                         .with("thread", thread_id_));
    handle_.reset();
    engine_.reset();
    return true;
}

uint64_t PoolThread::dispatchedCount() const {
    return pipe_ ? pipe_->dispatchedCount() : 0;
}

void PoolThread::notify(void (WorkerHandle::*hook)(int), const char* hook_name) {
    try {
        ((*handle_).*hook)(thread_id_);
    } catch (...) {
        Logger::getInstance().logCurrentError(LogLine("worker notification failed")
                                                  .with("hook", hook_name)
                                                  .with("worker", handle_->name())
                                                  .with("thread", thread_id_));
    }
}

} // namespace workpipe
