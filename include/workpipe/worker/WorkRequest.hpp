#pragma once

#include "workpipe/http/HttpRequest.hpp"
#include "workpipe/http/ResponseWriter.hpp"
#include <any>
#include <functional>
#include <memory>

namespace workpipe {

/**
 * A unit of work a worker hands to the pool.
 *
 * @tparam P type of the callback parameters passed through to the script
 * @tparam R type the script's return value is translated to for `after`
 */
template<typename P = std::any, typename R = std::any>
struct WorkRequest {
    // The request for the worker script to handle; null runs the script without one
    std::shared_ptr<HttpRequest> request;

    // Receives the script's output; must not be null if the output matters
    std::shared_ptr<ResponseWriter> response;

    // Handed to the script unchanged
    P callback_parameters{};

    // Called once, after the script finished, with its return value
    std::function<void(R)> after;
};

/**
 * Type-erased form of a WorkRequest, as seen by the pipe loop.
 */
struct PipedWork {
    std::shared_ptr<HttpRequest> request;
    std::shared_ptr<ResponseWriter> response;
    std::any callback_parameters;
    std::function<void(const std::any&)> after;
};

} // namespace workpipe
