#include <gtest/gtest.h>
#include "workpipe/http/ResponseRecorder.hpp"
#include "workpipe/pipe/PipeLoop.hpp"
#include "workpipe/worker/DefaultWorker.hpp"
#include "util/TestSupport.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace workpipe;

namespace {

std::shared_ptr<HttpRequest> getRequest(const std::string& target) {
    auto req = std::make_shared<HttpRequest>();
    req->method = "GET";
    req->target = target;
    req->setHeader("Host", "localhost");
    return req;
}

// Throws on the first provide, then behaves like an empty queue
class FlakyWorker : public TypedWorkerHandle<> {
public:
    std::string name() const override { return "flaky"; }
    std::string fileName() const override { return "flaky.php"; }
    Environment env() const override { return {}; }
    int minThreads() const override { return 1; }
    void threadActivated(int) override {}
    void threadDraining(int) override {}
    void threadDeactivated(int) override {}

    std::unique_ptr<Request> provideRequest(std::stop_token) override {
        if (calls.fetch_add(1) == 0) {
            throw std::runtime_error("backend unavailable");
        }
        return std::make_unique<Request>();
    }

    std::atomic<int> calls{0};
};

} // namespace

class PipeLoopTest : public ::testing::Test {
protected:
    template<typename P, typename R>
    ScriptBinding bindingFor(const DefaultWorker<P, R>& worker) {
        return ScriptBinding{worker.name(), worker.fileName(), worker.env()};
    }

    // Engine thread consuming the script worker's channel until stopped
    std::jthread serve(ScriptWorker& script, ExecutionEngine& engine) {
        return std::jthread([&script, &engine](std::stop_token stop) {
            script.serve(engine, 0, stop);
        });
    }

    CompletionPool completions_{2};
    test::RecordingLogger logger_;
    test::ScopedGlobalLogger guard_{logger_};
};

TEST_F(PipeLoopTest, NullPayloadRunsEmptyContext) {
    auto worker = std::make_shared<DefaultWorker<>>("w", "w.php", 1);
    ScriptWorker script(bindingFor(*worker), 1);
    PipeLoop loop(worker, script, completions_, 0);

    std::atomic<int> empty_runs{0};
    test::FunctionEngine engine([&](RequestContext& ctx) -> std::any {
        if (!ctx.hasRequest()) {
            empty_runs.fetch_add(1);
        }
        return {};
    });
    auto engine_thread = serve(script, engine);

    ASSERT_TRUE(worker->injectRequest(nullptr));
    std::stop_source stop;
    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_EQ(loop.dispatchedCount(), 1u);

    EXPECT_TRUE(test::waitUntil([&] { return empty_runs.load() == 1; }));
}

TEST_F(PipeLoopTest, NullPayloadDoesNotStopLaterRequests) {
    auto worker = std::make_shared<DefaultWorker<>>("w", "w.php", 2);
    ScriptWorker script(bindingFor(*worker), 2);
    PipeLoop loop(worker, script, completions_, 0);
    test::EchoEngine engine;
    auto engine_thread = serve(script, engine);

    auto recorder = std::make_shared<ResponseRecorder>();
    std::atomic<int> done{0};
    auto rq = std::make_unique<DefaultWorker<>::Request>();
    rq->request = getRequest("/after-null");
    rq->response = recorder;
    rq->after = [&](std::any) { done.fetch_add(1); };

    ASSERT_TRUE(worker->injectRequest(std::make_unique<DefaultWorker<>::Request>()));
    ASSERT_TRUE(worker->injectRequest(std::move(rq)));

    std::stop_source stop;
    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_TRUE(loop.runOnce(stop.get_token()));

    ASSERT_TRUE(test::waitUntil([&] { return done.load() == 1; }));
    EXPECT_EQ(recorder->body(), "GET /after-null");
    EXPECT_EQ(engine.executed.load(), 2);
}

TEST_F(PipeLoopTest, MalformedRequestIsLoggedAndSkipped) {
    auto worker = std::make_shared<DefaultWorker<>>("w", "w.php", 2);
    ScriptWorker script(bindingFor(*worker), 2);
    PipeLoop loop(worker, script, completions_, 5);

    bool malformed_called = false;
    auto bad = std::make_unique<DefaultWorker<>::Request>();
    bad->request = getRequest("not a target");
    bad->after = [&](std::any) { malformed_called = true; };
    ASSERT_TRUE(worker->injectRequest(std::move(bad)));
    ASSERT_TRUE(worker->injectRequest(std::make_unique<DefaultWorker<>::Request>()));

    std::stop_source stop;
    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_EQ(loop.dispatchedCount(), 0u);
    EXPECT_EQ(logger_.count("[ERROR] cannot create a request context worker=w thread=5"), 1u);

    // The loop keeps going with the next unit of work
    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_EQ(loop.dispatchedCount(), 1u);
    EXPECT_EQ(script.pending(), 1u);

    completions_.shutdown();
    EXPECT_FALSE(malformed_called);
}

TEST_F(PipeLoopTest, AfterFiresOnceAndOnlyAfterCompletion) {
    auto worker = std::make_shared<DefaultWorker<>>("w", "w.php", 1);
    ScriptWorker script(bindingFor(*worker), 1);
    PipeLoop loop(worker, script, completions_, 0);
    test::GatedEngine engine;
    auto engine_thread = serve(script, engine);

    std::atomic<int> calls{0};
    std::string value;
    auto rq = std::make_unique<DefaultWorker<>::Request>();
    rq->request = getRequest("/gated");
    rq->after = [&](std::any ret) {
        value = std::any_cast<std::string>(ret);
        calls.fetch_add(1);
    };
    ASSERT_TRUE(worker->injectRequest(std::move(rq)));

    std::stop_source stop;
    ASSERT_TRUE(loop.runOnce(stop.get_token()));
    ASSERT_TRUE(engine.waitEntered(1, std::chrono::milliseconds(2000)));

    // Script is still running
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(calls.load(), 0);

    engine.release();
    ASSERT_TRUE(test::waitUntil([&] { return calls.load() == 1; }));

    completions_.shutdown();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(value, "released");
}

TEST_F(PipeLoopTest, ThrowingScriptStillCompletesWithServerError) {
    auto worker = std::make_shared<DefaultWorker<>>("w", "w.php", 1);
    ScriptWorker script(bindingFor(*worker), 1);
    PipeLoop loop(worker, script, completions_, 0);
    test::ThrowingEngine engine;
    auto engine_thread = serve(script, engine);

    auto recorder = std::make_shared<ResponseRecorder>();
    std::atomic<int> calls{0};
    bool had_value = true;
    auto rq = std::make_unique<DefaultWorker<>::Request>();
    rq->request = getRequest("/boom");
    rq->response = recorder;
    rq->after = [&](std::any ret) {
        had_value = ret.has_value();
        calls.fetch_add(1);
    };
    ASSERT_TRUE(worker->injectRequest(std::move(rq)));

    std::stop_source stop;
    ASSERT_TRUE(loop.runOnce(stop.get_token()));
    ASSERT_TRUE(test::waitUntil([&] { return calls.load() == 1; }));

    EXPECT_FALSE(had_value);
    EXPECT_EQ(recorder->statusCode(), 500);
    EXPECT_EQ(logger_.count("script execution failed worker=w thread=0 uri=/boom error=\"script crashed\""), 1u);
}

TEST_F(PipeLoopTest, TypedReturnValueIsTranslated) {
    auto worker = std::make_shared<DefaultWorker<std::string, int>>("typed", "typed.php", 2);
    ScriptWorker script(bindingFor(*worker), 2);
    PipeLoop loop(worker, script, completions_, 0);

    // Returns the parameter's length, or a string for "mismatch"
    test::FunctionEngine engine([](RequestContext& ctx) -> std::any {
        std::string param = std::any_cast<std::string>(ctx.handlerParameters());
        if (param == "mismatch") {
            return std::string("not an int");
        }
        return static_cast<int>(param.size());
    });
    auto engine_thread = serve(script, engine);

    std::atomic<int> calls{0};
    int good = -1;
    int mismatched = -1;

    auto first = std::make_unique<DefaultWorker<std::string, int>::Request>();
    first->request = getRequest("/typed");
    first->callback_parameters = "four";
    first->after = [&](int ret) { good = ret; calls.fetch_add(1); };

    auto second = std::make_unique<DefaultWorker<std::string, int>::Request>();
    second->request = getRequest("/typed");
    second->callback_parameters = "mismatch";
    second->after = [&](int ret) { mismatched = ret; calls.fetch_add(1); };

    ASSERT_TRUE(worker->injectRequest(std::move(first)));
    ASSERT_TRUE(worker->injectRequest(std::move(second)));

    std::stop_source stop;
    ASSERT_TRUE(loop.runOnce(stop.get_token()));
    ASSERT_TRUE(loop.runOnce(stop.get_token()));
    ASSERT_TRUE(test::waitUntil([&] { return calls.load() == 2; }));

    EXPECT_EQ(good, 4);
    EXPECT_EQ(mismatched, 0);
    EXPECT_EQ(logger_.count("unexpected script return type worker=typed"), 1u);
}

TEST_F(PipeLoopTest, RunExitsWhenStopRequested) {
    auto worker = std::make_shared<DefaultWorker<>>("w", "w.php", 1);
    ScriptWorker script(bindingFor(*worker), 1);
    PipeLoop loop(worker, script, completions_, 0);

    std::stop_source stop;
    std::thread pipe([&] { loop.run(stop.get_token()); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.request_stop();
    pipe.join();

    EXPECT_EQ(loop.dispatchedCount(), 0u);
}

TEST_F(PipeLoopTest, BlockedDispatchIsDroppedOnStop) {
    auto worker = std::make_shared<DefaultWorker<>>("w", "w.php", 2);
    ScriptWorker script(bindingFor(*worker), 1);
    PipeLoop loop(worker, script, completions_, 0);

    std::atomic<int> calls{0};
    for (int i = 0; i < 2; ++i) {
        auto rq = std::make_unique<DefaultWorker<>::Request>();
        rq->request = getRequest("/" + std::to_string(i));
        rq->after = [&](std::any) { calls.fetch_add(1); };
        ASSERT_TRUE(worker->injectRequest(std::move(rq)));
    }

    std::stop_source stop;
    ASSERT_TRUE(loop.runOnce(stop.get_token()));

    // No engine consumes the channel, so the second dispatch blocks
    std::thread pipe([&] { loop.runOnce(stop.get_token()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    stop.request_stop();
    pipe.join();

    EXPECT_EQ(loop.dispatchedCount(), 1u);
    EXPECT_EQ(loop.droppedCount(), 1u);
    completions_.shutdown();
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(PipeLoopTest, ProviderExceptionDoesNotEndLoop) {
    auto worker = std::make_shared<FlakyWorker>();
    ScriptWorker script(ScriptBinding{"flaky", "flaky.php", {}}, 4);
    PipeLoop loop(worker, script, completions_, 2);

    std::stop_source stop;
    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_EQ(logger_.count("worker failed to provide a request worker=flaky thread=2 error=\"backend unavailable\""), 1u);

    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_EQ(loop.dispatchedCount(), 1u);
}

TEST_F(PipeLoopTest, FailingProviderBacksOff) {
    class BrokenWorker : public FlakyWorker {
    public:
        std::unique_ptr<Request> provideRequest(std::stop_token) override {
            calls.fetch_add(1);
            throw std::runtime_error("backend unavailable");
        }
    };

    auto worker = std::make_shared<BrokenWorker>();
    ScriptWorker script(ScriptBinding{"flaky", "flaky.php", {}}, 1);
    PipeLoop loop(worker, script, completions_, 0);

    std::stop_source stop;
    std::thread pipe([&] { loop.run(stop.get_token()); });

    // Delays of 10, 20, 40 and 80ms leave room for only a handful of calls
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    int calls = worker->calls.load();
    EXPECT_GE(calls, 2);
    EXPECT_LE(calls, 10);
    EXPECT_GE(loop.consecutiveProvideFailures(), 2u);

    // Stop interrupts the pending delay
    auto stop_at = std::chrono::steady_clock::now();
    stop.request_stop();
    pipe.join();
    EXPECT_LT(std::chrono::steady_clock::now() - stop_at, std::chrono::milliseconds(500));
    EXPECT_EQ(loop.dispatchedCount(), 0u);
}

TEST_F(PipeLoopTest, SuccessfulProvideResetsFailureCount) {
    auto worker = std::make_shared<FlakyWorker>();
    ScriptWorker script(ScriptBinding{"flaky", "flaky.php", {}}, 4);
    PipeLoop loop(worker, script, completions_, 0);

    std::stop_source stop;
    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_EQ(loop.consecutiveProvideFailures(), 1u);
    EXPECT_TRUE(loop.runOnce(stop.get_token()));
    EXPECT_EQ(loop.consecutiveProvideFailures(), 0u);
}

TEST_F(PipeLoopTest, DrainingEngineThreadLeavesQueuedWorkToOthers) {
    ScriptBinding binding{"w", "w.php", {}};
    ScriptWorker script(binding, 4);
    test::EchoEngine engine;

    std::stop_source live;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(script.dispatch(RequestContext::empty(binding), live.get_token()));
    }

    std::stop_source draining;
    draining.request_stop();
    script.serve(engine, 0, draining.get_token());
    EXPECT_EQ(engine.executed.load(), 0);
    EXPECT_EQ(script.pending(), 3u);

    {
        auto other = serve(script, engine);
        EXPECT_TRUE(test::waitUntil([&] { return engine.executed.load() == 3; }));
    }
    EXPECT_EQ(script.pending(), 0u);
}
