#pragma once

#include <string>

namespace fieldsync {

/**
 * @brief Failure taxonomy shared by the store, the queue and the transport
 *
 * HOW THE ENGINE REACTS:
 * - Transient / Timeout   -> retried with backoff (RetryPolicy)
 * - Rejected              -> dead-lettered at once, needs manual correction
 * - Authentication        -> aborts the whole cycle, queue left untouched
 * - Storage               -> fails the single operation, cycle continues
 * - Busy                  -> caller must try again later (item in flight)
 */
enum class ErrorKind {
    Transient,
    Timeout,
    Rejected,
    Authentication,
    Storage,
    Busy,
    NotFound,
    InvalidArgument
};

struct Error {
    ErrorKind kind = ErrorKind::Transient;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline bool is_retryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::Transient || kind == ErrorKind::Timeout;
}

inline bool is_fatal_to_cycle(ErrorKind kind) noexcept {
    return kind == ErrorKind::Authentication;
}

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Rejected: return "rejected";
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::Busy: return "busy";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

inline std::string describe(const Error& error) {
    return std::string(to_string(error.kind)) + ": " + error.message;
}

} // namespace fieldsync
