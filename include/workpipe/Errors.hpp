#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace workpipe {

/**
 * Thrown by ThreadPool::start() when the registered workers reserve more
 * threads than the pool has. Nothing is started when this is thrown; the
 * operator has to raise the thread budget or lower the reservations.
 */
class ThreadReservationError : public std::runtime_error {
public:
    ThreadReservationError(const std::string& what, size_t required, size_t available)
        : std::runtime_error(what), required_(required), available_(available) {}

    size_t required() const { return required_; }
    size_t available() const { return available_; }

private:
    size_t required_;
    size_t available_;
};

// Registration attempted after the pool took its startup snapshot
class RegistrationClosedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// A provided request could not be turned into a RequestContext
class RequestAdaptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace workpipe
