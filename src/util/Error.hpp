/**
 * @file Error.hpp
 * @brief Error type shared by every fallible operation
 *
 * Operations return std::expected<T, util::Error>. The error carries a
 * human-readable message, the OS error code when one exists, and a kind
 * used by the engine and scheduler to decide between retry, failure and
 * reporting.
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Error taxonomy for job execution
 */
enum class ErrorKind {
    Unknown,               ///< Unclassified failure
    TransientIO,           ///< Retryable I/O condition (busy device, EINTR, short write)
    PermanentIO,           ///< Target missing, permission denied, disk full
    TargetChanged,         ///< Target no longer matches the recorded job on resume
    VerificationMismatch,  ///< Digest unchanged after a wipe (reported, never fatal)
    StoreUnavailable,      ///< Job store could not persist state
    Timeout,               ///< Job deadline exceeded
    InvalidArgument,       ///< Malformed input (descriptor, config value, request)
    InvalidState,          ///< Operation not allowed in the job's current state
    NotFound               ///< Unknown job id or missing resource
};

/**
 * @struct Error
 * @brief Represents an error with a message, optional OS code and kind
 */
struct Error {
    std::string message;
    int code = 0;
    ErrorKind kind = ErrorKind::Unknown;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0, ErrorKind err_kind = ErrorKind::Unknown)
        : message(std::move(msg)), code(err_code), kind(err_kind) {}

    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code), kind(err_kind) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    [[nodiscard]] auto is_transient() const -> bool {
        return kind == ErrorKind::TransientIO;
    }

    auto operator==(const Error&) const -> bool = default;
};

/**
 * @brief Classify an errno value as transient or permanent I/O failure
 */
[[nodiscard]] inline auto classify_errno(int err) noexcept -> ErrorKind {
    switch (err) {
        case EINTR:
        case EAGAIN:
        case EBUSY:
        case ETIMEDOUT:
            return ErrorKind::TransientIO;
        default:
            return ErrorKind::PermanentIO;
    }
}

/**
 * @brief Build an I/O error from an errno value
 * @param what Operation description, e.g. "write /dev/sdb"
 * @param err errno captured right after the failing call
 */
[[nodiscard]] inline auto io_error(std::string_view what, int err) -> Error {
    return Error{classify_errno(err), std::string(what) + ": " + std::strerror(err), err};
}

[[nodiscard]] inline auto kind_to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::Unknown:
            return "unknown";
        case ErrorKind::TransientIO:
            return "transient-io";
        case ErrorKind::PermanentIO:
            return "permanent-io";
        case ErrorKind::TargetChanged:
            return "target-changed";
        case ErrorKind::VerificationMismatch:
            return "verification-mismatch";
        case ErrorKind::StoreUnavailable:
            return "store-unavailable";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::InvalidArgument:
            return "invalid-argument";
        case ErrorKind::InvalidState:
            return "invalid-state";
        case ErrorKind::NotFound:
            return "not-found";
    }
    return "unknown";
}

[[nodiscard]] inline auto kind_from_string(std::string_view name) -> ErrorKind {
    for (auto kind : {ErrorKind::TransientIO, ErrorKind::PermanentIO, ErrorKind::TargetChanged,
                      ErrorKind::VerificationMismatch, ErrorKind::StoreUnavailable,
                      ErrorKind::Timeout, ErrorKind::InvalidArgument, ErrorKind::InvalidState,
                      ErrorKind::NotFound}) {
        if (kind_to_string(kind) == name) {
            return kind;
        }
    }
    return ErrorKind::Unknown;
}

}  // namespace util
