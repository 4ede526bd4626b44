// SPDX-License-Identifier: MIT

#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace tsingest {

/// Error codes for ingestion runs and the transport boundary.
enum class ErrorCode {
    // Configuration
    InvalidConfig,         ///< Configuration value rejected

    // Provider lifecycle
    ProviderInitFailed,    ///< Row source init() failed
    ProviderCloseFailed,   ///< Row source close() failed

    // Connection / writer setup
    ConnectionFailed,      ///< Client could not be created for the endpoint
    WriterSetupFailed,     ///< Bulk writer could not be created

    // Writes
    InvalidRow,            ///< Row does not match the buffer's schema
    SubmitFailed,          ///< Batch could not be handed to the transport
    WriteFailed,           ///< Remote store rejected a batch
    InsertFailed,          ///< Row insert request failed
    Timeout,               ///< Write not acknowledged within the timeout
    WriterClosed,          ///< Writer closed while writes were outstanding

    // Schema
    InvalidSchema,         ///< Table schema incomplete or inconsistent

    // State
    InvalidState,          ///< Method called in wrong writer/engine state
};

/// Error payload carried by every failed operation.
struct Error {
    ErrorCode code;        ///< Classified error code
    std::string message;   ///< Human-readable description
};

/// Result of an operation that can fail with an Error.
template <typename T>
using Result = std::expected<T, Error>;

/// Shorthand for returning a failed Result.
inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// Return a short category string for an error code (e.g. "provider", "write").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:
            return "config";
        case ErrorCode::ProviderInitFailed:
        case ErrorCode::ProviderCloseFailed:
            return "provider";
        case ErrorCode::ConnectionFailed:
            return "connection";
        case ErrorCode::WriterSetupFailed:
            return "writer";
        case ErrorCode::InvalidRow:
        case ErrorCode::SubmitFailed:
        case ErrorCode::WriteFailed:
        case ErrorCode::InsertFailed:
        case ErrorCode::Timeout:
        case ErrorCode::WriterClosed:
            return "write";
        case ErrorCode::InvalidSchema:
            return "schema";
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

/// Format an error as "<category>: <message>" for logs and reports.
inline std::string to_string(const Error& e) {
    std::string out{error_category(e.code)};
    out += ": ";
    out += e.message;
    return out;
}

}  // namespace tsingest
