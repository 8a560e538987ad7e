/**
 * Echo Worker
 *
 * Registers a worker, starts a thread pool with an engine that echoes each
 * request back, and keeps injecting requests until interrupted.
 *
 * Usage: ./echo_worker [threads] [count]
 *
 * - threads: pool size (default: WORKPIPE_NUM_THREADS or hardware concurrency)
 * - count:   stop after this many requests (default: run until SIGINT/SIGTERM)
 */

#include "workpipe/Config.hpp"
#include "workpipe/Errors.hpp"
#include "workpipe/http/HttpParser.hpp"
#include "workpipe/http/ResponseRecorder.hpp"
#include "workpipe/logger/AsyncLogger.hpp"
#include "workpipe/logger/ConsoleLogger.hpp"
#include "workpipe/pool/ThreadPool.hpp"
#include "workpipe/worker/DefaultWorker.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <thread>

using namespace workpipe;

namespace {

std::atomic<bool> running{true};

// Writes the request line, headers and body back as text/plain
class EchoEngine : public ExecutionEngine {
public:
    void threadStarted(const ScriptBinding& binding, int thread_id) override {
        Logger::getInstance().logMessage(LogLine("engine thread started")
                                             .with("script", binding.file_name)
                                             .with("thread", thread_id));
    }

    void execute(RequestContext& context) override {
        std::string out;
        if (context.hasRequest()) {
            out = context.method() + " " + context.target() + " " + context.version() + "\n";
            for (const auto& [name, value] : context.headers()) {
                out += name + ": " + value + "\n";
            }
            out += "\n" + context.body();
        } else {
            out = "(no request)\n";
        }

        if (ResponseWriter* writer = context.responseWriter()) {
            writer->setHeader("Content-Type", "text/plain");
            writer->writeHeader(200);
            writer->write(out);
        }
        context.complete(out.size());
    }
};

const char* const kRequests[] = {
    "GET /hello?name=workpipe HTTP/1.1\r\nHost: localhost\r\n\r\n",
    "POST /jobs HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/json\r\nContent-Length: 15\r\n\r\n{\"job\":\"print\"}",
    "GET https://example.com:8443/absolute HTTP/1.1\r\n\r\n",
};

} // namespace

int main(int argc, char** argv) {
    auto console = std::make_unique<ConsoleLogger>();
    AsyncLogger logger(std::move(console));
    Logger::setGlobalLogger(&logger);

    try {
        PoolConfig config = PoolConfig::fromEnvironment();
        if (argc > 1) {
            config.num_threads = std::stoi(argv[1]);
        }
        long long limit = argc > 2 ? std::stoll(argv[2]) : -1;

        // Block signals in main thread and spawn a watcher thread using sigwait
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        std::thread([set]() {
            int sig = 0;
            if (sigwait(&set, &sig) == 0) {
                running.store(false);
            }
        }).detach();

        // Replies carry the byte count as their return value
        auto worker = std::make_shared<DefaultWorker<std::string, size_t>>("echo", "/srv/echo.php", 2);
        WorkerRegistry::global().registerWorker(worker);

        ThreadPool pool(config, WorkerRegistry::global(), std::make_shared<EchoEngine>());
        pool.start();

        std::cout << "Echo worker running with " << pool.activeThreadsFor("echo") << " of "
                  << pool.numThreads() << " threads (Ctrl+C to stop)\n";

        long long sent = 0;
        std::atomic<long long> answered{0};
        while (running.load() && (limit < 0 || sent < limit)) {
            const char* raw = kRequests[sent % (sizeof(kRequests) / sizeof(kRequests[0]))];

            auto req = std::make_shared<HttpRequest>();
            if (!HttpParser::parse_complete(raw, *req)) {
                Logger::getInstance().logError(LogLine("sample request does not parse").with("index", sent));
                break;
            }

            auto recorder = std::make_shared<ResponseRecorder>();
            auto rq = std::make_unique<DefaultWorker<std::string, size_t>::Request>();
            rq->request = std::move(req);
            rq->response = recorder;
            rq->callback_parameters = "request-" + std::to_string(sent);
            rq->after = [recorder, &answered](size_t bytes) {
                std::cout << "--- " << recorder->statusCode() << " (" << bytes << " bytes)\n"
                          << recorder->body() << std::endl;
                answered.fetch_add(1);
            };

            if (!worker->injectRequest(std::move(rq))) {
                break;
            }
            ++sent;
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        // Give in-flight requests a moment before stopping
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (answered.load() < sent && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        pool.stop();
        worker->close();
        std::cout << "Served " << answered.load() << " of " << sent << " requests\n";
    } catch (const ThreadReservationError& e) {
        std::cerr << "Cannot start: " << e.what() << std::endl;
        Logger::setGlobalLogger(nullptr);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        Logger::setGlobalLogger(nullptr);
        return 1;
    }

    Logger::setGlobalLogger(nullptr);
    return 0;
}
