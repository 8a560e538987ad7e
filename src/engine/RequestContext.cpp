#include "workpipe/engine/RequestContext.hpp"
#include "workpipe/Errors.hpp"
#include "workpipe/logger/Logger.hpp"
#include "workpipe/pipe/CompletionPool.hpp"
#include <cctype>
#include <cstring>

namespace workpipe {

namespace {

bool isTokenChar(unsigned char c) {
    return std::isalnum(c) || std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

bool isToken(std::string_view value) {
    if (value.empty()) return false;
    for (unsigned char c : value) {
        if (!isTokenChar(c)) return false;
    }
    return true;
}

bool isHttpVersion(std::string_view version) {
    // HTTP/<digit> or HTTP/<digit>.<digit>
    if (version.size() != 6 && version.size() != 8) return false;
    if (version.substr(0, 5) != "HTTP/" || !std::isdigit(static_cast<unsigned char>(version[5]))) return false;
    if (version.size() == 8) {
        return version[6] == '.' && std::isdigit(static_cast<unsigned char>(version[7]));
    }
    return true;
}

// Rejects whitespace, control characters and broken %XX escapes
void validateTargetChars(std::string_view part, const char* what) {
    for (size_t i = 0; i < part.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(part[i]);
        if (c <= 0x20 || c == 0x7f) {
            throw RequestAdaptError(std::string("invalid character in ") + what);
        }
        if (c == '%') {
            if (i + 2 >= part.size()) {
                throw RequestAdaptError(std::string("truncated escape in ") + what);
            }
            if (!std::isxdigit(static_cast<unsigned char>(part[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(part[i + 2]))) {
                throw RequestAdaptError(std::string("invalid escape in ") + what);
            }
            i += 2;
        }
    }
}

std::string cgiHeaderName(const std::string& header) {
    std::string name = "HTTP_";
    name.reserve(name.size() + header.size());
    for (unsigned char c : header) {
        name += c == '-' ? '_' : static_cast<char>(std::toupper(c));
    }
    return name;
}

std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

RequestContext::RequestContext(const ScriptBinding& binding)
    : worker_name_(binding.worker_name),
      script_filename_(binding.file_name),
      environment_(binding.env) {}

std::shared_ptr<RequestContext> RequestContext::empty(const ScriptBinding& binding) {
    std::shared_ptr<RequestContext> context(new RequestContext(binding));
    context->buildEnvironment();
    return context;
}

std::shared_ptr<RequestContext> RequestContext::adapt(const HttpRequest& request, const ScriptBinding& binding) {
    std::shared_ptr<RequestContext> context(new RequestContext(binding));
    RequestContext& ctx = *context;

    if (!isToken(request.method)) {
        throw RequestAdaptError("invalid method '" + request.method + "'");
    }

    ctx.version_ = request.version.empty() ? "HTTP/1.1" : request.version;
    if (!isHttpVersion(ctx.version_)) {
        throw RequestAdaptError("unsupported protocol version '" + ctx.version_ + "'");
    }

    for (const auto& [name, value] : request.headers) {
        if (!isToken(name)) {
            throw RequestAdaptError("invalid header name '" + name + "'");
        }
        if (value.find_first_of(std::string_view("\r\n\0", 3)) != std::string::npos) {
            throw RequestAdaptError("invalid value for header '" + name + "'");
        }
        ctx.headers_[lowercase(name)] = value;
    }

    const std::string& target = request.target;
    if (target.empty()) {
        throw RequestAdaptError("empty request target");
    }

    std::string_view rest(target);
    std::string authority;

    if (target == "*") {
        if (request.method != "OPTIONS") {
            throw RequestAdaptError("asterisk target is only valid for OPTIONS");
        }
    } else if (target[0] != '/') {
        size_t sep = target.find("://");
        if (sep == std::string::npos) {
            throw RequestAdaptError("unsupported request target '" + target + "'");
        }
        std::string scheme = lowercase(target.substr(0, sep));
        if (scheme != "http" && scheme != "https") {
            throw RequestAdaptError("unsupported scheme '" + scheme + "'");
        }
        ctx.scheme_ = scheme;

        rest = rest.substr(sep + 3);
        size_t authority_end = rest.find_first_of("/?#");
        authority.assign(rest.substr(0, authority_end));
        if (authority.empty()) {
            throw RequestAdaptError("missing host in request target");
        }
        validateTargetChars(authority, "host");
        rest = authority_end == std::string_view::npos ? std::string_view() : rest.substr(authority_end);
    }

    // Fragments never reach the script
    if (size_t hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    std::string_view path = rest;
    std::string_view query;
    if (size_t question = rest.find('?'); question != std::string_view::npos) {
        path = rest.substr(0, question);
        query = rest.substr(question + 1);
    }
    validateTargetChars(path, "path");
    validateTargetChars(query, "query");

    ctx.path_ = path.empty() ? (target == "*" ? "*" : "/") : std::string(path);
    ctx.query_string_.assign(query);
    ctx.target_ = ctx.path_;
    if (!ctx.query_string_.empty()) {
        ctx.target_ += '?';
        ctx.target_ += ctx.query_string_;
    }

    if (!authority.empty()) {
        ctx.host_ = authority;
        if (ctx.headers_.find("host") == ctx.headers_.end()) {
            ctx.headers_["host"] = authority;
        }
    } else {
        ctx.host_ = read_header(ctx.headers_, "host");
    }

    if (auto it = ctx.headers_.find("content-length"); it != ctx.headers_.end()) {
        const std::string& length = it->second;
        if (length.empty() || length.find_first_not_of("0123456789") != std::string::npos) {
            throw RequestAdaptError("invalid content-length '" + length + "'");
        }
    }

    ctx.method_ = request.method;
    ctx.body_ = request.body;
    ctx.has_request_ = true;
    ctx.buildEnvironment();
    return context;
}

void RequestContext::buildEnvironment() {
    environment_["SCRIPT_FILENAME"] = script_filename_;
    environment_["SCRIPT_NAME"] = "/" + baseName(script_filename_);
    environment_["WORKPIPE_WORKER"] = worker_name_;

    if (!has_request_) {
        return;
    }

    environment_["REQUEST_METHOD"] = method_;
    environment_["REQUEST_URI"] = target_;
    environment_["DOCUMENT_URI"] = path_;
    environment_["QUERY_STRING"] = query_string_;
    environment_["SERVER_PROTOCOL"] = version_;
    environment_["REQUEST_SCHEME"] = scheme_;
    if (scheme_ == "https") {
        environment_["HTTPS"] = "on";
    }

    // SERVER_NAME/SERVER_PORT from host[:port], including bracketed IPv6 literals
    std::string server_name = host_;
    std::string server_port = scheme_ == "https" ? "443" : "80";
    size_t colon = host_.rfind(':');
    size_t bracket = host_.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        server_name = host_.substr(0, colon);
        server_port = host_.substr(colon + 1);
    }
    environment_["SERVER_NAME"] = server_name;
    environment_["SERVER_PORT"] = server_port;

    for (const auto& [name, value] : headers_) {
        if (name == "content-type") {
            environment_["CONTENT_TYPE"] = value;
        } else if (name == "content-length") {
            environment_["CONTENT_LENGTH"] = value;
        } else {
            environment_[cgiHeaderName(name)] = value;
        }
    }
    if (environment_.find("CONTENT_LENGTH") == environment_.end() && !body_.empty()) {
        environment_["CONTENT_LENGTH"] = std::to_string(body_.size());
    }
}

void RequestContext::onComplete(Continuation continuation, CompletionPool& pool) {
    continuation_ = std::move(continuation);
    completion_pool_ = &pool;
}

bool RequestContext::complete(std::any handler_return) {
    if (completing_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    handler_return_ = std::move(handler_return);
    done_.fire();

    if (!continuation_ || !completion_pool_) {
        return true;
    }

    auto self = shared_from_this();
    Continuation continuation = std::move(continuation_);
    continuation_ = nullptr;

    bool posted = completion_pool_->post([self, continuation = std::move(continuation)] {
        continuation(self->handler_return_);
    });
    if (!posted) {
        Logger::getInstance().logWarning(LogLine("completion pool closed, dropping callback")
                                             .with("worker", worker_name_));
    }
    return true;
}

} // namespace workpipe
