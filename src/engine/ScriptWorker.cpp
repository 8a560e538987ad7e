#include "workpipe/engine/ScriptWorker.hpp"
#include "workpipe/Config.hpp"
#include "workpipe/logger/Logger.hpp"

namespace workpipe {

ScriptWorker::ScriptWorker(ScriptBinding binding, size_t dispatch_capacity)
    : binding_(std::move(binding)), channel_(dispatch_capacity) {}

bool ScriptWorker::dispatch(std::shared_ptr<RequestContext> context, std::stop_token stop) {
    return channel_.enqueue(std::move(context), stop);
}

void ScriptWorker::serve(ExecutionEngine& engine, int thread_id, std::stop_token stop) {
    try {
        engine.threadStarted(binding_, thread_id);
    } catch (...) {
        Logger::getInstance().logCurrentError(LogLine("engine thread setup failed")
                                                  .with("worker", name())
                                                  .with("thread", thread_id));
    }

    // A draining thread takes no new work; queued contexts stay for the other threads
    std::shared_ptr<RequestContext> context;
    while (!stop.stop_requested() && channel_.dequeue(context, stop)) {
        run(engine, *context, thread_id);
        context.reset();
    }

    try {
        engine.threadStopped(binding_, thread_id);
    } catch (...) {
        Logger::getInstance().logCurrentError(LogLine("engine thread teardown failed")
                                                  .with("worker", name())
                                                  .with("thread", thread_id));
    }
}

void ScriptWorker::run(ExecutionEngine& engine, RequestContext& context, int thread_id) {
    WORKPIPE_DEBUG_LOG("executing request worker=" << name() << " thread=" << thread_id
                       << " uri=" << context.target());
    try {
        engine.execute(context);
    } catch (...) {
        Logger::getInstance().logCurrentError(LogLine("script execution failed")
                                                  .with("worker", name())
                                                  .with("thread", thread_id)
                                                  .with("uri", context.target()));
        ResponseWriter* writer = context.responseWriter();
        if (writer && !writer->headerWritten()) {
            writer->writeHeader(500);
        }
    }

    // Every dispatched context completes exactly once
    if (!context.isDone()) {
        context.complete();
    }
    executed_.fetch_add(1, std::memory_order_relaxed);
}

void ScriptWorker::shutdown() {
    channel_.shutdown();
}

} // namespace workpipe
