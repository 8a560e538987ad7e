#include "workpipe/http/ResponseRecorder.hpp"

namespace workpipe {

void ResponseRecorder::setHeader(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (header_written_) return;
    response_.setHeader(name, value);
}

void ResponseRecorder::writeHeader(int status_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (header_written_) return;
    response_.setStatus(status_code);
    header_written_ = true;
}

void ResponseRecorder::write(std::string_view data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!header_written_) {
        response_.setStatus(200);
        header_written_ = true;
    }
    response_.body.append(data.data(), data.size());
}

bool ResponseRecorder::headerWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return header_written_;
}

HttpResponse ResponseRecorder::result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HttpResponse copy = response_;
    if (copy.getHeader("content-length").empty()) {
        copy.setHeader("content-length", std::to_string(copy.body.size()));
    }
    return copy;
}

std::string ResponseRecorder::body() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_.body;
}

int ResponseRecorder::statusCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_.status_code;
}

} // namespace workpipe
