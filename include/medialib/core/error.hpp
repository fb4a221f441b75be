#pragma once

#include <string>

namespace medialib {

/**
 * @brief Failure categories shared by the catalog, the pipeline and the dispatcher
 *
 * PERMANENCE:
 * Only TransientIO is worth retrying. Everything else describes input that
 * will fail the same way on the next attempt.
 */
enum class ErrorKind {
    InvalidRequest,      // Wrong library type, unreadable path with no asset, bad config
    NotFound,            // Library or asset missing from the catalog
    AlreadyExists,       // Catalog uniqueness constraint
    UnprocessableAsset,  // Undetermined or disallowed MIME type
    TransientIO,         // Read/stat failures, unavailable import roots
    Internal
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline bool is_permanent(ErrorKind kind) {
    return kind != ErrorKind::TransientIO;
}

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::UnprocessableAsset: return "UnprocessableAsset";
        case ErrorKind::TransientIO: return "TransientIO";
        case ErrorKind::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline std::string to_string(const Error& error) {
    return std::string(error_kind_name(error.kind)) + ": " + error.message;
}

} // namespace medialib
