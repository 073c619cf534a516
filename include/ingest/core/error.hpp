#pragma once

#include <string>

namespace ingest {

/**
 * @brief Failure categories surfaced by the pipeline
 *
 * The first block mirrors the operational taxonomy (what an operator sees
 * in the logs); the second block covers lower-level causes that are usually
 * wrapped by one of the first.
 */
enum class ErrorCode {
    ConfigurationMissing,   // No watch path / no transport credentials (pauses, never fatal)
    ClaimRaceLost,          // Marker rename failed, retried next scan
    TransferFailed,         // Any transport-level error, Job goes to the failure bucket
    LinkResolutionFailed,   // Share link unavailable (non-fatal)
    NotificationFailed,     // Email/SMS failed (non-fatal)
    ArchiveFailed,          // Directory could not be moved, left in place
    RegistrationOrphan,     // Blob stored but never registered with the server

    InvalidArgument,
    IoError,
    ProtocolError,
    Timeout,
    NotConnected
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigurationMissing: return "ConfigurationMissing";
        case ErrorCode::ClaimRaceLost: return "ClaimRaceLost";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::LinkResolutionFailed: return "LinkResolutionFailed";
        case ErrorCode::NotificationFailed: return "NotificationFailed";
        case ErrorCode::ArchiveFailed: return "ArchiveFailed";
        case ErrorCode::RegistrationOrphan: return "RegistrationOrphan";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::NotConnected: return "NotConnected";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::IoError;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /// Same error with a different category, keeping the original text as cause
    Error rewrap(ErrorCode outer, const std::string& context) const {
        return Error(outer, context + ": " + message);
    }

    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

} // namespace ingest
