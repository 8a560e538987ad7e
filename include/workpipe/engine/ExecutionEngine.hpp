#pragma once

#include "workpipe/engine/RequestContext.hpp"

namespace workpipe {

/**
 * Boundary to the script runtime.
 *
 * execute() runs on an engine thread owned by the pool. It writes the
 * script's output to context.responseWriter() (when non-null) and finishes
 * with context.complete(return_value). An engine that returns without
 * completing, or throws, gets its context completed with an empty value by
 * the engine thread.
 *
 * One engine instance serves every worker and thread, so implementations
 * must be thread-safe.
 */
class ExecutionEngine {
public:
    virtual ~ExecutionEngine() = default;

    // Per-thread runtime setup/teardown
    virtual void threadStarted(const ScriptBinding& binding, int thread_id) {
        (void)binding;
        (void)thread_id;
    }
    virtual void threadStopped(const ScriptBinding& binding, int thread_id) {
        (void)binding;
        (void)thread_id;
    }

    virtual void execute(RequestContext& context) = 0;
};

} // namespace workpipe
