#pragma once
#include <stdexcept>
#include <string>

namespace hoofy {

enum class ErrorKind { NotFound, InvalidArgument, AlreadyExists, Unavailable, Internal };

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::AlreadyExists:   return "already_exists";
        case ErrorKind::Unavailable:     return "unavailable";
        case ErrorKind::Internal:        return "internal";
    }
    return "internal";
}

// Every failure raised by the memory engine. Unavailable means the store was
// busy past its lock timeout and the call may be retried as-is.
class MemoryError : public std::runtime_error {
public:
    MemoryError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return kind_ == ErrorKind::Unavailable; }

private:
    ErrorKind kind_;
};

} // namespace hoofy
