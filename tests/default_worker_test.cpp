#include <gtest/gtest.h>
#include "workpipe/worker/DefaultWorker.hpp"
#include "util/TestSupport.hpp"
#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

using namespace workpipe;

namespace {

std::unique_ptr<DefaultWorker<>::Request> requestFor(const std::string& target) {
    auto rq = std::make_unique<DefaultWorker<>::Request>();
    rq->request = std::make_shared<HttpRequest>();
    rq->request->method = "GET";
    rq->request->target = target;
    return rq;
}

} // namespace

TEST(DefaultWorkerTest, ExposesStaticConfiguration) {
    DefaultWorker<> worker("mailer", "/app/mailer.php", 3, {{"QUEUE", "mail"}});

    EXPECT_EQ(worker.name(), "mailer");
    EXPECT_EQ(worker.fileName(), "/app/mailer.php");
    EXPECT_EQ(worker.minThreads(), 3);
    EXPECT_EQ(worker.env().at("QUEUE"), "mail");
}

TEST(DefaultWorkerTest, LifecycleNotificationsAreNetZero) {
    DefaultWorker<> worker("w", "w.php", 2);

    worker.threadActivated(1);
    worker.threadActivated(2);
    EXPECT_EQ(worker.activatedCount(), 2);

    worker.threadDraining(1);
    EXPECT_EQ(worker.drainingCount(), 1);

    worker.threadDeactivated(1);
    EXPECT_EQ(worker.activatedCount(), 1);
    EXPECT_EQ(worker.drainingCount(), 0);
}

TEST(DefaultWorkerTest, DeactivateWithoutDrainAppliesSameAdjustment) {
    DefaultWorker<> worker("w", "w.php", 1);

    worker.threadActivated(7);
    worker.threadDeactivated(7);

    EXPECT_EQ(worker.activatedCount(), 0);
    EXPECT_EQ(worker.drainingCount(), -1);
}

TEST(DefaultWorkerTest, ProvidesRequestsInInjectionOrder) {
    DefaultWorker<> worker("w", "w.php", 2);
    ASSERT_TRUE(worker.injectRequest(requestFor("/a")));
    ASSERT_TRUE(worker.injectRequest(requestFor("/b")));

    std::stop_source stop;
    auto first = worker.provideRequest(stop.get_token());
    auto second = worker.provideRequest(stop.get_token());

    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->request->target, "/a");
    EXPECT_EQ(second->request->target, "/b");
}

TEST(DefaultWorkerTest, QueueCapacityFollowsMinThreads) {
    DefaultWorker<> zero("zero", "z.php", 0);
    auto rq = requestFor("/1");
    EXPECT_TRUE(zero.tryInjectRequest(rq));
    auto overflow = requestFor("/2");
    EXPECT_FALSE(zero.tryInjectRequest(overflow));
    ASSERT_NE(overflow, nullptr);
    EXPECT_EQ(overflow->request->target, "/2");

    DefaultWorker<> three("three", "t.php", 3);
    for (int i = 0; i < 3; ++i) {
        auto item = requestFor("/" + std::to_string(i));
        EXPECT_TRUE(three.tryInjectRequest(item));
    }
    EXPECT_EQ(three.queuedRequests(), 3u);
}

TEST(DefaultWorkerTest, InjectBlocksUntilSpaceIsAvailable) {
    DefaultWorker<> worker("w", "w.php", 1);
    ASSERT_TRUE(worker.injectRequest(requestFor("/first")));

    std::atomic<bool> injected{false};
    std::thread producer([&] {
        worker.injectRequest(requestFor("/second"));
        injected = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(injected.load());

    std::stop_source stop;
    auto first = worker.provideRequest(stop.get_token());
    producer.join();
    EXPECT_TRUE(injected.load());
    EXPECT_EQ(first->request->target, "/first");
}

TEST(DefaultWorkerTest, ProvideReturnsNullWhenStopped) {
    DefaultWorker<> worker("w", "w.php", 1);
    std::stop_source stop;

    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.request_stop();
    });
    auto rq = worker.provideRequest(stop.get_token());
    stopper.join();

    EXPECT_EQ(rq, nullptr);
}

TEST(DefaultWorkerTest, NullInjectionIsAnEmptyInvocation) {
    DefaultWorker<> worker("w", "w.php", 1);
    ASSERT_TRUE(worker.injectRequest(nullptr));

    std::stop_source stop;
    auto rq = worker.provideRequest(stop.get_token());
    ASSERT_NE(rq, nullptr);
    EXPECT_EQ(rq->request, nullptr);
}

TEST(DefaultWorkerTest, CloseRejectsFurtherInjection) {
    DefaultWorker<> worker("w", "w.php", 1);
    worker.close();
    EXPECT_FALSE(worker.injectRequest(requestFor("/late")));

    std::stop_source stop;
    EXPECT_EQ(worker.provideRequest(stop.get_token()), nullptr);
}

// ============================================================================
// Typed callback values
// ============================================================================

TEST(TypedWorkerTest, PipedWorkCarriesParametersAndTranslatesReturn) {
    DefaultWorker<int, std::string> worker("typed", "typed.php", 1);

    std::string received;
    auto rq = std::make_unique<DefaultWorker<int, std::string>::Request>();
    rq->callback_parameters = 42;
    rq->after = [&](std::string value) { received = std::move(value); };
    ASSERT_TRUE(worker.injectRequest(std::move(rq)));

    std::stop_source stop;
    WorkerHandle& handle = worker;
    auto work = handle.providePipedWork(stop.get_token());
    ASSERT_TRUE(work.has_value());
    EXPECT_EQ(std::any_cast<int>(work->callback_parameters), 42);
    ASSERT_TRUE(static_cast<bool>(work->after));

    work->after(std::any(std::string("done")));
    EXPECT_EQ(received, "done");
}

TEST(TypedWorkerTest, EmptyOrMismatchedReturnYieldsDefault) {
    test::RecordingLogger logger;
    test::ScopedGlobalLogger guard(logger);

    EXPECT_EQ(detail::translateReturn<int>(std::any(), "w"), 0);
    EXPECT_EQ(logger.count("unexpected script return type"), 0u);

    EXPECT_EQ(detail::translateReturn<int>(std::any(std::string("nope")), "w"), 0);
    EXPECT_EQ(logger.count("unexpected script return type worker=w"), 1u);

    std::any passthrough = detail::translateReturn<std::any>(std::any(3.5), "w");
    EXPECT_EQ(std::any_cast<double>(passthrough), 3.5);
}

TEST(TypedWorkerTest, StopYieldsNoPipedWork) {
    DefaultWorker<> worker("w", "w.php", 1);
    std::stop_source stop;
    stop.request_stop();

    WorkerHandle& handle = worker;
    EXPECT_FALSE(handle.providePipedWork(stop.get_token()).has_value());
}
