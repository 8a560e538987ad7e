#pragma once

#include "workpipe/logger/Logger.hpp"

namespace workpipe {
class ConsoleLogger : public Logger {
  public:
    void logMessage(std::string_view msg) override;
    void logWarning(std::string_view msg) override;
    void logError(std::string_view msg) override;
};
} // namespace workpipe
