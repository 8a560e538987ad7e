#pragma once
#include <string>
#include <string_view>

namespace workpipe {

/**
 * Output sink for one request. The execution engine writes the status,
 * headers and body produced by the worker script here.
 *
 * Headers set after writeHeader() (or after the first write(), which
 * implies a 200) are ignored. Calls may come from the engine thread while
 * other threads read, so implementations synchronize internally.
 */
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual void setHeader(const std::string& name, const std::string& value) = 0;
    virtual void writeHeader(int status_code) = 0;
    virtual void write(std::string_view data) = 0;
    virtual bool headerWritten() const = 0;
};

} // namespace workpipe
