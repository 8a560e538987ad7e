#include <gtest/gtest.h>
#include "workpipe/pool/ThreadStateMachine.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace workpipe;

class ThreadStateMachineTest : public ::testing::Test {
protected:
    ThreadStateMachine sm_;
};

// ============================================================================
// Basic State Transition Tests
// ============================================================================

TEST_F(ThreadStateMachineTest, InitialStateIsInactive) {
    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::INACTIVE);
}

TEST_F(ThreadStateMachineTest, ActivateSucceedsFromInactive) {
    EXPECT_TRUE(sm_.tryActivate());
    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::ACTIVE);
}

TEST_F(ThreadStateMachineTest, ActivateFailsWhileActive) {
    ASSERT_TRUE(sm_.tryActivate());
    EXPECT_FALSE(sm_.tryActivate());
}

TEST_F(ThreadStateMachineTest, DrainRequiresActive) {
    EXPECT_FALSE(sm_.tryDrain());
    ASSERT_TRUE(sm_.tryActivate());
    EXPECT_TRUE(sm_.tryDrain());
    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::DRAINING);
}

TEST_F(ThreadStateMachineTest, ActivateFailsWhileDraining) {
    ASSERT_TRUE(sm_.tryActivate());
    ASSERT_TRUE(sm_.tryDrain());
    EXPECT_FALSE(sm_.tryActivate());
    EXPECT_FALSE(sm_.tryDrain());
}

// ============================================================================
// Complete Workflow Tests
// ============================================================================

TEST_F(ThreadStateMachineTest, FullLifecycle) {
    EXPECT_TRUE(sm_.tryActivate());
    EXPECT_TRUE(sm_.tryDrain());
    EXPECT_TRUE(sm_.tryDeactivate());
    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::INACTIVE);

    // Slot can be reassigned afterwards
    EXPECT_TRUE(sm_.tryActivate());
}

TEST_F(ThreadStateMachineTest, DeactivateWithoutDrain) {
    ASSERT_TRUE(sm_.tryActivate());
    EXPECT_TRUE(sm_.tryDeactivate());
    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::INACTIVE);
}

TEST_F(ThreadStateMachineTest, DeactivateInactiveFails) {
    EXPECT_FALSE(sm_.tryDeactivate());
}

// ============================================================================
// Concurrent Access Tests
// ============================================================================

TEST_F(ThreadStateMachineTest, ConcurrentActivateOnlyOneSucceeds) {
    std::atomic<int> success_count{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&]() {
            if (sm_.tryActivate()) {
                success_count++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(success_count.load(), 1);
    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::ACTIVE);
}

TEST_F(ThreadStateMachineTest, ConcurrentDrainOnlyOneSucceeds) {
    ASSERT_TRUE(sm_.tryActivate());

    std::atomic<int> drains{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&]() {
            if (sm_.tryDrain()) {
                drains++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(drains.load(), 1);
    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::DRAINING);
}

// ============================================================================
// Stress Tests
// ============================================================================

TEST_F(ThreadStateMachineTest, HighContentionLifecycle) {
    std::atomic<int> cycles{0};
    std::vector<std::thread> threads;
    constexpr int NUM_THREADS = 16;
    constexpr int ATTEMPTS_PER_THREAD = 200;

    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < ATTEMPTS_PER_THREAD; ++j) {
                if (sm_.tryActivate()) {
                    std::this_thread::yield();
                    // The activating thread owns the slot until it deactivates it
                    EXPECT_TRUE(sm_.tryDrain());
                    EXPECT_TRUE(sm_.tryDeactivate());
                    cycles++;
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(sm_.getState(), ThreadStateMachine::State::INACTIVE);
    EXPECT_GT(cycles.load(), 0);
}
