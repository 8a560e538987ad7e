#include "workpipe/logger/Logger.hpp"
#include "workpipe/logger/ConsoleLogger.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace {
    static std::atomic<workpipe::Logger*> logger{nullptr};
}
namespace workpipe {

void Logger::log(LogLevel level, std::string_view msg) {
    switch (level) {
    case LogLevel::MESSAGE:
        logMessage(msg);
        break;
    case LogLevel::WARNING:
        logWarning(msg);
        break;
    case LogLevel::ERROR:
        logError(msg);
        break;
    }
}

void Logger::logCurrentError(std::string_view context_msg) {
    auto eptr = std::current_exception();
    std::string full_message = std::string(context_msg);

    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            full_message += " error=\"";
            full_message += e.what();
            full_message += "\"";
        } catch (...) {
            full_message += " error=\"unknown exception type\"";
        }
    } else {
        full_message += " error=\"no current exception\"";
    }

    logError(full_message);
}

void Logger::setGlobalLogger(Logger* ptr) {
    logger.store(ptr, std::memory_order_release);
}

Logger& Logger::getInstance() {
    auto* ptr = logger.load(std::memory_order_acquire);
    if (!ptr) {
        // Fallback: create a temporary console logger if none is set
        // Use a function-static variable to ensure it's initialized on first use
        static workpipe::ConsoleLogger* fallback_logger = new workpipe::ConsoleLogger();
        return *fallback_logger;
    }
    return *ptr;
}

}
