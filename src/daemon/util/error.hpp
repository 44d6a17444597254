#pragma once

#include <expected>
#include <string>
#include <string_view>

enum class ErrorCode {
    ConnectionFailed,
    Timeout,
    DnsFailure,
    PrematureClose,
    IncompleteTransfer,
    HttpStatus,
    Authentication,
    InsufficientSpace,
    InstallFailed,
    ProcessFailed,
    BinaryNotFound,
    NotReady,
    Cancelled,
    Protocol,
    Io,
    InvalidArgument,
};

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;
    long http_status = 0;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorCode code, std::string message, long http_status = 0) {
    return std::unexpected(Error{.code = code, .message = std::move(message), .http_status = http_status});
}

// Transient network failures worth another attempt.
inline bool is_transient(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::Timeout:
        case ErrorCode::DnsFailure:
        case ErrorCode::PrematureClose:
        case ErrorCode::IncompleteTransfer:
            return true;
        default:
            return false;
    }
}

inline bool is_transient(const Error& e) { return is_transient(e.code); }

inline std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed: return "connection_failed";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::DnsFailure: return "dns_failure";
        case ErrorCode::PrematureClose: return "premature_close";
        case ErrorCode::IncompleteTransfer: return "incomplete_transfer";
        case ErrorCode::HttpStatus: return "http_status";
        case ErrorCode::Authentication: return "authentication";
        case ErrorCode::InsufficientSpace: return "insufficient_space";
        case ErrorCode::InstallFailed: return "install_failed";
        case ErrorCode::ProcessFailed: return "process_failed";
        case ErrorCode::BinaryNotFound: return "binary_not_found";
        case ErrorCode::NotReady: return "not_ready";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Protocol: return "protocol";
        case ErrorCode::Io: return "io";
        case ErrorCode::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}
