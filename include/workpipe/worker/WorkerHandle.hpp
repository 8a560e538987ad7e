#pragma once

#include "workpipe/Environment.hpp"
#include "workpipe/logger/Logger.hpp"
#include "workpipe/worker/WorkRequest.hpp"
#include <any>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace workpipe {

/**
 * A worker lets external code feed requests to a worker script instead of
 * the script waiting on regular traffic.
 *
 * name(), fileName(), env() and minThreads() are read once, when the pool
 * starts, so register the worker before that (see WorkerRegistry).
 * minThreads() reserves threads from the pool's budget. If the reservation
 * cannot be honored the pool refuses to start; don't be greedy.
 *
 * When a thread is activated and nearly ready, threadActivated() is called
 * with an opaque thread id; this is the time to set up per-thread resources.
 * threadDraining() announces that the thread is about to be returned to the
 * pool, and threadDeactivated() that it has been. Notifications for
 * different threads may arrive concurrently and must not block.
 *
 * Once a thread is active, providePipedWork() is called in a loop from that
 * thread's pipe. It blocks until work is available and must return promptly
 * (with nullopt) once `stop` is requested, otherwise the thread cannot be
 * drained.
 *
 * Most implementations derive from TypedWorkerHandle instead of
 * implementing providePipedWork() directly.
 */
class WorkerHandle {
public:
    virtual ~WorkerHandle() = default;

    virtual std::string name() const = 0;
    virtual std::string fileName() const = 0;
    virtual Environment env() const = 0;
    virtual int minThreads() const = 0;

    virtual void threadActivated(int thread_id) = 0;
    virtual void threadDraining(int thread_id) = 0;
    virtual void threadDeactivated(int thread_id) = 0;

    /**
     * Next unit of work. nullopt while stop is not requested counts as an
     * empty invocation.
     */
    virtual std::optional<PipedWork> providePipedWork(std::stop_token stop) = 0;
};

namespace detail {

// Convert the engine's return value to what the caller's `after` expects
template<typename R>
R translateReturn(const std::any& value, const std::string& worker) {
    if constexpr (std::is_same_v<R, std::any>) {
        return value;
    } else {
        if (!value.has_value()) {
            return R{};
        }
        if (const R* typed = std::any_cast<R>(&value)) {
            return *typed;
        }
        Logger::getInstance().logWarning(LogLine("unexpected script return type")
                                             .with("worker", worker)
                                             .with("expected", typeid(R).name())
                                             .with("actual", value.type().name()));
        return R{};
    }
}

} // namespace detail

/**
 * WorkerHandle whose requests carry callback parameters of type P and whose
 * completion callbacks receive an R.
 *
 * A null return from provideRequest() means stop was requested; a returned
 * WorkRequest with a null request is an empty invocation.
 */
template<typename P = std::any, typename R = std::any>
class TypedWorkerHandle : public WorkerHandle {
public:
    static_assert(std::is_copy_constructible_v<P>, "callback parameters are stored in std::any");
    static_assert(std::is_default_constructible_v<R>, "R{} is passed when the script returns nothing");

    using Request = WorkRequest<P, R>;

    virtual std::unique_ptr<Request> provideRequest(std::stop_token stop) = 0;

    std::optional<PipedWork> providePipedWork(std::stop_token stop) final {
        std::unique_ptr<Request> rq = provideRequest(stop);
        if (!rq) {
            return std::nullopt;
        }

        PipedWork work;
        work.request = std::move(rq->request);
        work.response = std::move(rq->response);
        work.callback_parameters = std::any(std::move(rq->callback_parameters));
        if (rq->after) {
            work.after = [after = std::move(rq->after), worker = name()](const std::any& value) {
                after(detail::translateReturn<R>(value, worker));
            };
        }
        return work;
    }
};

} // namespace workpipe
