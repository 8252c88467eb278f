#pragma once

#include <stdexcept>
#include <string>

namespace Lookalike {

enum class ErrorKind {
    NotFound,               // annotate on a pair that has no row
    ConstraintViolation,    // write referencing a non-live or retired item
    TransientStorageError,  // I/O or concurrency failure, retryable
    IntegrityAnomaly,       // orphan found by the sweep
    InvalidTransition       // kind change the state machine forbids
};

/**
 * @brief Error raised at the relation store boundary.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    bool retryable() const noexcept { return kind_ == ErrorKind::TransientStorageError; }

private:
    ErrorKind kind_;
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:              return "NotFound";
        case ErrorKind::ConstraintViolation:   return "ConstraintViolation";
        case ErrorKind::TransientStorageError: return "TransientStorageError";
        case ErrorKind::IntegrityAnomaly:      return "IntegrityAnomaly";
        case ErrorKind::InvalidTransition:     return "InvalidTransition";
    }
    return "Unknown";
}

} // namespace Lookalike
