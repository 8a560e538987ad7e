#include "workpipe/logger/Logger.hpp"

namespace workpipe {

namespace {

bool needsQuoting(std::string_view value) {
    if (value.empty()) return true;
    for (char c : value) {
        if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n' || c == '\r') {
            return true;
        }
    }
    return false;
}

} // namespace

LogLine& LogLine::with(std::string_view key, std::string_view value) {
    text_ += ' ';
    text_ += key;
    text_ += '=';

    if (!needsQuoting(value)) {
        text_ += value;
        return *this;
    }

    text_ += '"';
    for (char c : value) {
        switch (c) {
            case '"': text_ += "\\\""; break;
            case '\\': text_ += "\\\\"; break;
            case '\n': text_ += "\\n"; break;
            case '\r': text_ += "\\r"; break;
            case '\t': text_ += "\\t"; break;
            default: text_ += c; break;
        }
    }
    text_ += '"';
    return *this;
}

LogLine& LogLine::with(std::string_view key, long long value) {
    return with(key, std::string_view(std::to_string(value)));
}

LogLine& LogLine::with(std::string_view key, size_t value) {
    return with(key, std::string_view(std::to_string(value)));
}

} // namespace workpipe
