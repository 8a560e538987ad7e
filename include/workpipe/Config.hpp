#pragma once

#include <cstddef>
#include <string>

// Debug configuration
// Set to 1 to enable verbose debug output, 0 for production builds
#ifndef WORKPIPE_DEBUG
#define WORKPIPE_DEBUG 0
#endif

// Debug logging macro - compiles to nothing when WORKPIPE_DEBUG is 0
#if WORKPIPE_DEBUG
#include "workpipe/logger/Logger.hpp"
#include <sstream>
#define WORKPIPE_DEBUG_LOG(msg) \
    do { \
        std::ostringstream oss; \
        oss << msg; \
        workpipe::Logger::getInstance().logMessage(oss.str()); \
    } while(0)
#else
#define WORKPIPE_DEBUG_LOG(msg) ((void)0)
#endif

namespace workpipe {

/**
 * Sizing of a ThreadPool.
 *
 * Zero values select defaults at start time (see resolved*()).
 */
struct PoolConfig {
    // Total thread budget shared by every registered worker (0 = hardware concurrency)
    int num_threads = 0;

    // Threads running completion callbacks
    int completion_threads = 2;

    // Per-worker dispatch channel capacity (0 = the worker's reservation, at least 1)
    int dispatch_capacity = 0;

    /**
     * Throws std::invalid_argument if any field is negative.
     */
    void validate() const;

    size_t resolvedThreads() const;
    size_t resolvedCompletionThreads() const;
    size_t resolvedDispatchCapacity(int min_threads) const;

    /**
     * Build a config from WORKPIPE_NUM_THREADS, WORKPIPE_COMPLETION_THREADS and
     * WORKPIPE_DISPATCH_CAPACITY. Unset variables keep their defaults.
     * Throws std::invalid_argument naming the variable on a malformed value.
     */
    static PoolConfig fromEnvironment();
};

} // namespace workpipe
