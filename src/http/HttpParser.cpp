#include "workpipe/http/HttpParser.hpp"
#include <cerrno>
#include <cstdlib>

namespace workpipe {

HttpParser::ParseResult HttpParser::parse_request(std::string_view buf, HttpRequest& out, size_t& consumed) {
    consumed = 0;
    if (buf.empty()) return ParseResult::Incomplete;

    size_t header_end = buf.find("\r\n\r\n");
    if (header_end == std::string_view::npos) {
        if (buf.size() > MAX_REQUEST_LINE + (MAX_HEADERS * MAX_HEADER_LINE)) {
            return ParseResult::BadRequest;
        }
        return ParseResult::Incomplete;
    }

    size_t headers_bytes = header_end + 4;

    size_t line_end = buf.find("\r\n");
    if (line_end > MAX_REQUEST_LINE) return ParseResult::BadRequest;

    HttpRequest parsed;
    if (!parse_request_line(buf.substr(0, line_end), parsed)) return ParseResult::BadRequest;

    // Header block without the request line and the terminating blank line
    std::string_view header_block;
    if (line_end + 2 < header_end) {
        header_block = buf.substr(line_end + 2, header_end - line_end);
    }
    if (!parse_headers(header_block, parsed)) return ParseResult::BadRequest;

    size_t content_length = 0;
    if (auto it = parsed.headers.find("content-length"); it != parsed.headers.end()) {
        const std::string& raw = it->second;
        errno = 0;
        char* end = nullptr;
        unsigned long long value = std::strtoull(raw.c_str(), &end, 10);
        if (raw.empty() || errno != 0 || *end != '\0' || value > MAX_BODY) {
            return ParseResult::BadRequest;
        }
        content_length = static_cast<size_t>(value);
    }

    size_t total_needed = headers_bytes + content_length;
    if (buf.size() < total_needed) return ParseResult::Incomplete;

    parsed.body.assign(buf.data() + headers_bytes, content_length);

    out = std::move(parsed);
    consumed = total_needed;
    return ParseResult::Success;
}

bool HttpParser::parse_complete(std::string_view buf, HttpRequest& out) {
    size_t consumed = 0;
    return parse_request(buf, out, consumed) == ParseResult::Success && consumed == buf.size();
}

bool HttpParser::parse_request_line(std::string_view line, HttpRequest& out) {
    // METHOD SP request-target SP HTTP-version, single spaces only
    size_t first = line.find(' ');
    if (first == std::string_view::npos || first == 0) return false;
    size_t second = line.find(' ', first + 1);
    if (second == std::string_view::npos || second == first + 1) return false;
    if (line.find(' ', second + 1) != std::string_view::npos) return false;

    std::string_view version = line.substr(second + 1);
    if (version.empty()) return false;

    out.method.assign(line.substr(0, first));
    out.target.assign(line.substr(first + 1, second - first - 1));
    out.version.assign(version);
    return true;
}

bool HttpParser::parse_headers(std::string_view headers_section, HttpRequest& out) {
    size_t pos = 0;
    size_t header_count = 0;

    while (pos < headers_section.size()) {
        size_t eol = headers_section.find("\r\n", pos);
        if (eol == std::string_view::npos) eol = headers_section.size();

        std::string_view line = headers_section.substr(pos, eol - pos);
        pos = eol + 2;
        if (line.empty()) continue;

        if (line.size() > MAX_HEADER_LINE) return false;
        if (++header_count > MAX_HEADERS) return false;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) return false;

        std::string name = lowercase(std::string(line.substr(0, colon)));
        std::string value = trim_header_value(line.substr(colon + 1));

        // Chunked bodies are not supported by this minimal parser
        if (name == "transfer-encoding" && lowercase(value).find("chunked") != std::string::npos) {
            return false;
        }

        out.headers[std::move(name)] = std::move(value);
    }

    return true;
}

std::string HttpParser::trim_header_value(std::string_view value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && (value[begin] == ' ' || value[begin] == '\t')) ++begin;
    while (end > begin && (value[end - 1] == ' ' || value[end - 1] == '\t')) --end;
    return std::string(value.substr(begin, end - begin));
}

} // namespace workpipe
