#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

namespace workpipe {

using HeaderMap = std::unordered_map<std::string, std::string>;

inline std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

inline std::string read_header(const HeaderMap &headers, const std::string &name) {
    auto it = headers.find(lowercase(name));
    return it != headers.end() ? it->second : "";
}

/**
 * Inbound HTTP request handed to a worker.
 * Headers are stored in lowercase for case-insensitive lookup.
 *
 * `target` is the request-target as received: origin form
 * ("/path?query") or absolute form ("https://host/path?query").
 */
struct HttpRequest {
    std::string method;
    std::string target;
    std::string version = "HTTP/1.1";
    HeaderMap headers;
    std::string body;

    std::string getHeader(const std::string &name) const { return read_header(headers, name); }

    void setHeader(const std::string &name, const std::string &value) {
        headers[lowercase(name)] = value;
    }
};

} // namespace workpipe
