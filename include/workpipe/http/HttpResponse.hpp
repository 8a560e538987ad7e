#pragma once
#include "workpipe/http/HttpRequest.hpp"
#include <string>

namespace workpipe {

/**
 * Snapshot of what a worker script produced for one request.
 * Headers are stored in lowercase for case-insensitive lookup.
 */
struct HttpResponse {
    int status_code = 200;
    std::string status_text = "OK";
    HeaderMap headers;
    std::string body;

    std::string getHeader(const std::string &name) const { return read_header(headers, name); }

    void setStatus(int code, const std::string &text = "") {
        status_code = code;
        status_text = text.empty() ? defaultStatusText(code) : text;
    }

    void setHeader(const std::string &name, const std::string &value) {
        headers[lowercase(name)] = value;
    }

    static std::string defaultStatusText(int code) {
        switch (code) {
            case 200: return "OK";
            case 201: return "Created";
            case 202: return "Accepted";
            case 204: return "No Content";
            case 301: return "Moved Permanently";
            case 302: return "Found";
            case 304: return "Not Modified";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 409: return "Conflict";
            case 413: return "Payload Too Large";
            case 415: return "Unsupported Media Type";
            case 422: return "Unprocessable Entity";
            case 429: return "Too Many Requests";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            case 504: return "Gateway Timeout";
            default: return "Unknown";
        }
    }
};

} // namespace workpipe
