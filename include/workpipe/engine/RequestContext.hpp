#pragma once

#include "workpipe/Environment.hpp"
#include "workpipe/engine/CompletionSignal.hpp"
#include "workpipe/http/HttpRequest.hpp"
#include "workpipe/http/ResponseWriter.hpp"
#include <any>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace workpipe {

class CompletionPool;

/**
 * Static description of the worker script a context runs against.
 */
struct ScriptBinding {
    std::string worker_name;
    std::string file_name;
    Environment env;
};

/**
 * Engine-side representation of one unit of work.
 *
 * Created by the pipe loop (adapt() or empty()), handed to the execution
 * engine through the worker's dispatch channel, and completed by the engine
 * with complete(). handlerReturn() may only be read once isDone() has been
 * observed (or waitDone() returned).
 *
 * Always owned by a std::shared_ptr; the factories are the only way to
 * create one.
 */
class RequestContext : public std::enable_shared_from_this<RequestContext> {
public:
    using Continuation = std::function<void(const std::any&)>;

    /**
     * Validate a request and build a context for it.
     * Accepts origin-form ("/path?query") and absolute-form
     * ("https://host/path?query") targets.
     * @throws RequestAdaptError if the request is malformed
     */
    static std::shared_ptr<RequestContext> adapt(const HttpRequest& request, const ScriptBinding& binding);

    /**
     * Context without an inbound request (warm-up/administrative runs).
     */
    static std::shared_ptr<RequestContext> empty(const ScriptBinding& binding);

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    bool hasRequest() const { return has_request_; }

    const std::string& method() const { return method_; }
    const std::string& target() const { return target_; }
    const std::string& path() const { return path_; }
    const std::string& queryString() const { return query_string_; }
    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    const std::string& version() const { return version_; }
    const HeaderMap& headers() const { return headers_; }
    std::string getHeader(const std::string& name) const { return read_header(headers_, name); }
    const std::string& body() const { return body_; }

    const std::string& workerName() const { return worker_name_; }
    const std::string& scriptFilename() const { return script_filename_; }

    // CGI-style variables: worker environment plus request meta-variables
    const Environment& environment() const { return environment_; }

    void setResponseWriter(std::shared_ptr<ResponseWriter> writer) { response_writer_ = std::move(writer); }
    // May be null when the producer supplied no sink
    ResponseWriter* responseWriter() const { return response_writer_.get(); }

    void setHandlerParameters(std::any parameters) { handler_parameters_ = std::move(parameters); }
    const std::any& handlerParameters() const { return handler_parameters_; }

    /**
     * Arrange for continuation(handlerReturn()) to run on pool once the
     * context completes. Must be called before the context is dispatched.
     */
    void onComplete(Continuation continuation, CompletionPool& pool);

    /**
     * Called by the execution engine when the script finished.
     * Stores the return value, fires the done signal and schedules the
     * continuation, if any.
     * @return false if the context had already been completed
     */
    bool complete(std::any handler_return = {});

    bool isDone() const { return done_.isFired(); }
    void waitDone() const { done_.wait(); }

    template<typename Rep, typename Period>
    bool waitDoneFor(std::chrono::duration<Rep, Period> timeout) const { return done_.waitFor(timeout); }

    const std::any& handlerReturn() const { return handler_return_; }

private:
    explicit RequestContext(const ScriptBinding& binding);

    void buildEnvironment();

    bool has_request_ = false;
    std::string method_;
    std::string target_;
    std::string path_;
    std::string query_string_;
    std::string scheme_ = "http";
    std::string host_;
    std::string version_;
    HeaderMap headers_;
    std::string body_;

    std::string worker_name_;
    std::string script_filename_;
    Environment environment_;

    std::shared_ptr<ResponseWriter> response_writer_;
    std::any handler_parameters_;

    Continuation continuation_;
    CompletionPool* completion_pool_ = nullptr;

    std::atomic<bool> completing_{false};
    std::any handler_return_;
    CompletionSignal done_;
};

} // namespace workpipe
