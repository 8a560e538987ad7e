#pragma once
#include "workpipe/http/HttpRequest.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace workpipe {

/**
 * Minimal HTTP/1.x request parser used to build worker requests from raw
 * request text (producers that receive bytes rather than structured
 * requests, and the echo example).
 */
class HttpParser {
  public:
    enum class ParseResult {
        Success,        // Complete request parsed successfully
        Incomplete,     // Need more data (not an error)
        BadRequest      // Malformed request or unsupported feature
    };

    static constexpr size_t MAX_REQUEST_LINE = 8 * 1024;      // 8 KiB
    static constexpr size_t MAX_HEADERS = 200;               // max header count
    static constexpr size_t MAX_HEADER_LINE = 16 * 1024;     // 16 KiB per header
    static constexpr size_t MAX_BODY = 64 * 1024 * 1024;     // 64 MiB

    // Parse a single HTTP/1.x request from buffer
    // On Success: consumed is set to bytes used, out contains parsed request
    // On Incomplete/BadRequest: consumed is 0
    static ParseResult parse_request(std::string_view buf, HttpRequest& out, size_t& consumed);

    // Parse buf as exactly one complete request; false otherwise
    static bool parse_complete(std::string_view buf, HttpRequest& out);

  private:
    static bool parse_request_line(std::string_view line, HttpRequest& out);
    static bool parse_headers(std::string_view headers_section, HttpRequest& out);
    static std::string trim_header_value(std::string_view value);
};

} // namespace workpipe
