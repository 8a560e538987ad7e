#pragma once

#include "workpipe/logger/Logger.hpp"

#include <memory>
#include <string_view>

namespace workpipe {

/**
 * Hands messages to a background thread that forwards them to the delegate.
 * Falls back to logging synchronously when the queue is full; messages still
 * queued at destruction are flushed before the thread exits.
 */
class AsyncLogger : public Logger {
  public:
    explicit AsyncLogger(std::unique_ptr<Logger> delegate);
    ~AsyncLogger();

    void logMessage(std::string_view msg) override;
    void logWarning(std::string_view msg) override;
    void logError(std::string_view msg) override;

  private:
    class Impl;
    std::unique_ptr<Impl> fImpl;
};
} // namespace workpipe
