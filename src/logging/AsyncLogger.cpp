#include "workpipe/logger/AsyncLogger.hpp"
#include "workpipe/util/BlockingQueue.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace workpipe {

namespace {

struct LogMessage {
    LogLevel level = LogLevel::MESSAGE;
    std::string text;
};

constexpr size_t kQueueCapacity = 65536;

} // namespace

class AsyncLogger::Impl {
  public:
    explicit Impl(std::unique_ptr<Logger> delegate)
        : fDelegate(std::move(delegate)), fQueue(kQueueCapacity), fRunning(true),
          fWorkerThread(&Impl::workerThreadFunc, this) {}

    ~Impl() {
        fRunning.store(false, std::memory_order_release);

        // Wake the worker thread; it drains whatever is left before exiting
        fQueue.shutdown();

        if (fWorkerThread.joinable()) {
            fWorkerThread.join();
        }
    }

    void enqueue(LogLevel level, std::string_view msg) {
        if (!fRunning.load(std::memory_order_acquire)) {
            // During shutdown, drop the message to avoid use-after-free
            return;
        }

        LogMessage entry{level, std::string(msg)};
        if (fQueue.try_enqueue(std::move(entry))) {
            return;
        }

        if (!fRunning.load(std::memory_order_acquire)) {
            return;
        }

        // Queue full - log synchronously with a warning prefix. The delegate
        // is not thread-safe, so serialize with the worker thread.
        std::string fallback = "[ASYNC_BUFFER_FULL] ";
        fallback += msg;
        std::lock_guard<std::mutex> lock(fDelegateMutex);
        fDelegate->log(level, fallback);
    }

  private:
    void workerThreadFunc() {
        LogMessage msg;
        while (fQueue.dequeue(msg)) {
            process(msg);
        }

        // Drain remaining messages on shutdown using non-blocking calls
        while (fQueue.try_dequeue(msg)) {
            process(msg);
        }
    }

    void process(const LogMessage& msg) {
        std::lock_guard<std::mutex> lock(fDelegateMutex);
        fDelegate->log(msg.level, msg.text);
    }

    std::unique_ptr<Logger> fDelegate;
    std::mutex fDelegateMutex;
    BlockingQueue<LogMessage> fQueue;
    std::atomic<bool> fRunning;
    std::thread fWorkerThread;
};

AsyncLogger::AsyncLogger(std::unique_ptr<Logger> delegate)
    : fImpl(std::make_unique<AsyncLogger::Impl>(std::move(delegate))) {}

AsyncLogger::~AsyncLogger() = default;

void AsyncLogger::logMessage(std::string_view msg) { fImpl->enqueue(LogLevel::MESSAGE, msg); }
void AsyncLogger::logWarning(std::string_view msg) { fImpl->enqueue(LogLevel::WARNING, msg); }
void AsyncLogger::logError(std::string_view msg) { fImpl->enqueue(LogLevel::ERROR, msg); }

} // namespace workpipe
