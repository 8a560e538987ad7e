#include "workpipe/pipe/PipeLoop.hpp"
#include "workpipe/Config.hpp"
#include "workpipe/Errors.hpp"
#include "workpipe/logger/Logger.hpp"
#include <algorithm>
#include <chrono>

namespace workpipe {

namespace {
constexpr std::chrono::milliseconds kProvideBackoffBase{10};
constexpr std::chrono::milliseconds kProvideBackoffMax{1000};
constexpr uint32_t kProvideBackoffMaxShift = 7;
} // namespace

PipeLoop::PipeLoop(std::shared_ptr<WorkerHandle> handle, ScriptWorker& worker, CompletionPool& completions, int thread_id)
    : handle_(std::move(handle)), worker_(worker), completions_(completions), thread_id_(thread_id) {}

void PipeLoop::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        if (!runOnce(stop)) {
            break;
        }
    }
    WORKPIPE_DEBUG_LOG("pipe loop stopped worker=" << worker_.name() << " thread=" << thread_id_);
}

bool PipeLoop::runOnce(std::stop_token stop) {
    std::optional<PipedWork> work;
    try {
        work = handle_->providePipedWork(stop);
    } catch (...) {
        Logger::getInstance().logCurrentError(LogLine("worker failed to provide a request")
                                                  .with("worker", worker_.name())
                                                  .with("thread", thread_id_));
        backoff(stop, provide_failures_.fetch_add(1, std::memory_order_relaxed) + 1);
        return !stop.stop_requested();
    }
    provide_failures_.store(0, std::memory_order_relaxed);

    if (!work && stop.stop_requested()) {
        return false;
    }

    std::shared_ptr<RequestContext> context;
    if (!work || !work->request) {
        // No inbound request: run the script for its side effects only
        context = RequestContext::empty(worker_.binding());
    } else {
        try {
            context = RequestContext::adapt(*work->request, worker_.binding());
        } catch (const RequestAdaptError& e) {
            Logger::getInstance().logError(LogLine("cannot create a request context")
                                               .with("worker", worker_.name())
                                               .with("thread", thread_id_)
                                               .with("error", e.what()));
            return true;
        }
    }

    if (work) {
        context->setResponseWriter(std::move(work->response));
        context->setHandlerParameters(std::move(work->callback_parameters));
        if (work->after) {
            context->onComplete(std::move(work->after), completions_);
        }
    }

    WORKPIPE_DEBUG_LOG("queue the external worker request worker=" << worker_.name()
                       << " thread=" << thread_id_ << " uri=" << context->target());

    if (!worker_.dispatch(std::move(context), stop)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        WORKPIPE_DEBUG_LOG("request dropped before dispatch worker=" << worker_.name()
                           << " thread=" << thread_id_);
        return !stop.stop_requested();
    }
    dispatched_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void PipeLoop::backoff(std::stop_token stop, uint32_t failures) {
    uint32_t shift = std::min(failures - 1, kProvideBackoffMaxShift);
    std::chrono::milliseconds delay = std::min(kProvideBackoffBase * (1u << shift), kProvideBackoffMax);
    std::unique_lock<std::mutex> lock(backoff_mutex_);
    backoff_cv_.wait_for(lock, stop, delay, [] { return false; });
}

} // namespace workpipe
