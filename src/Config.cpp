#include "workpipe/Config.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace workpipe {

namespace {

int readIntVariable(const char* name, int fallback) {
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0') {
        return fallback;
    }

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(raw, &end, 10);
    if (errno != 0 || end == raw || *end != '\0' || value < 0 || value > INT_MAX) {
        throw std::invalid_argument(std::string(name) + ": expected a non-negative integer, got '" +
                                    raw + "'");
    }
    return static_cast<int>(value);
}

} // namespace

void PoolConfig::validate() const {
    if (num_threads < 0) {
        throw std::invalid_argument("PoolConfig: num_threads must not be negative");
    }
    if (completion_threads < 0) {
        throw std::invalid_argument("PoolConfig: completion_threads must not be negative");
    }
    if (dispatch_capacity < 0) {
        throw std::invalid_argument("PoolConfig: dispatch_capacity must not be negative");
    }
}

size_t PoolConfig::resolvedThreads() const {
    if (num_threads > 0) {
        return static_cast<size_t>(num_threads);
    }
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

size_t PoolConfig::resolvedCompletionThreads() const {
    return completion_threads > 0 ? static_cast<size_t>(completion_threads) : 1;
}

size_t PoolConfig::resolvedDispatchCapacity(int min_threads) const {
    if (dispatch_capacity > 0) {
        return static_cast<size_t>(dispatch_capacity);
    }
    return min_threads > 0 ? static_cast<size_t>(min_threads) : 1;
}

PoolConfig PoolConfig::fromEnvironment() {
    PoolConfig config;
    config.num_threads = readIntVariable("WORKPIPE_NUM_THREADS", config.num_threads);
    config.completion_threads = readIntVariable("WORKPIPE_COMPLETION_THREADS", config.completion_threads);
    config.dispatch_capacity = readIntVariable("WORKPIPE_DISPATCH_CAPACITY", config.dispatch_capacity);
    return config;
}

} // namespace workpipe
