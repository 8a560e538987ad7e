#pragma once

#include <atomic>

namespace workpipe {

/**
 * Lock-free lifecycle of one pool thread's assignment to a worker.
 *
 * State Transitions:
 * - INACTIVE -> ACTIVE: thread assigned to a worker (tryActivate)
 * - ACTIVE -> DRAINING: thread being reclaimed (tryDrain)
 * - DRAINING -> INACTIVE: thread returned to the pool (tryDeactivate)
 * - ACTIVE -> INACTIVE: deactivation without a drain (tryDeactivate)
 *
 * Each transition succeeds for exactly one caller, which then owns the
 * matching worker notification.
 */
class ThreadStateMachine {
public:
    enum class State : int {
        INACTIVE = 0,
        ACTIVE = 1,
        DRAINING = 2
    };

    ThreadStateMachine() : state_(State::INACTIVE) {}

    /**
     * Attempts transition: INACTIVE -> ACTIVE
     * @return false if the thread is already assigned
     */
    bool tryActivate() {
        State expected = State::INACTIVE;
        return state_.compare_exchange_strong(
            expected,
            State::ACTIVE,
            std::memory_order_acq_rel,
            std::memory_order_relaxed
        );
    }

    /**
     * Attempts transition: ACTIVE -> DRAINING
     * @return false if the thread is not active or another caller is draining it
     */
    bool tryDrain() {
        State expected = State::ACTIVE;
        return state_.compare_exchange_strong(
            expected,
            State::DRAINING,
            std::memory_order_acq_rel,
            std::memory_order_relaxed
        );
    }

    /**
     * Attempts transitions DRAINING -> INACTIVE, then ACTIVE -> INACTIVE
     * @return false if the thread was already inactive
     */
    bool tryDeactivate() {
        State expected = State::DRAINING;
        if (state_.compare_exchange_strong(
                expected,
                State::INACTIVE,
                std::memory_order_release,
                std::memory_order_relaxed)) {
            return true;
        }

        expected = State::ACTIVE;
        return state_.compare_exchange_strong(
            expected,
            State::INACTIVE,
            std::memory_order_release,
            std::memory_order_relaxed
        );
    }

    /**
     * Get current state (for testing/debugging only)
     * Note: State may change immediately after reading
     */
    State getState() const {
        return state_.load(std::memory_order_acquire);
    }

private:
    std::atomic<State> state_;
};

} // namespace workpipe
