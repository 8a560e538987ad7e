#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace workpipe {

enum class LogLevel : uint8_t { MESSAGE = 0, WARNING = 1, ERROR = 2 };

class Logger {
public:
    virtual ~Logger() = default;
    virtual void logMessage(std::string_view msg) = 0;
    virtual void logWarning(std::string_view msg) = 0;
    virtual void logError(std::string_view msg) = 0;

    // Route to logMessage/logWarning/logError by level
    void log(LogLevel level, std::string_view msg);

    /**
     * Log the current exception with a context message.
     * Should be called from within a catch(...) block.
     * Combines the provided message with the exception details.
     */
    void logCurrentError(std::string_view context_msg);

    static void setGlobalLogger(Logger* ptr);
    static Logger& getInstance();
};

/**
 * A log message with trailing key=value attributes, e.g.
 *
 *   LogLine("queue the external worker request").with("worker", name).with("thread", 3)
 *
 * renders as `queue the external worker request worker=name thread=3`.
 * Values containing spaces, quotes or '=' are double-quoted.
 */
class LogLine {
public:
    explicit LogLine(std::string_view msg) : text_(msg) {}

    LogLine& with(std::string_view key, std::string_view value);
    LogLine& with(std::string_view key, const char* value) { return with(key, std::string_view(value)); }
    LogLine& with(std::string_view key, const std::string& value) { return with(key, std::string_view(value)); }
    LogLine& with(std::string_view key, long long value);
    LogLine& with(std::string_view key, int value) { return with(key, static_cast<long long>(value)); }
    LogLine& with(std::string_view key, size_t value);

    const std::string& str() const { return text_; }
    operator std::string_view() const { return text_; }

private:
    std::string text_;
};

} // namespace workpipe
