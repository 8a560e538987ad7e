#pragma once
#include "workpipe/http/HttpResponse.hpp"
#include "workpipe/http/ResponseWriter.hpp"
#include <mutex>

namespace workpipe {

// ResponseWriter that keeps everything in memory; result() returns a copy
class ResponseRecorder : public ResponseWriter {
public:
    void setHeader(const std::string& name, const std::string& value) override;
    void writeHeader(int status_code) override;
    void write(std::string_view data) override;
    bool headerWritten() const override;

    HttpResponse result() const;
    std::string body() const;
    int statusCode() const;

private:
    mutable std::mutex mutex_;
    HttpResponse response_;
    bool header_written_ = false;
};

} // namespace workpipe
