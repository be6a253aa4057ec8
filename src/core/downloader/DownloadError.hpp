#pragma once

/**
 * DownloadError.hpp
 *
 * Error taxonomy of the download core.
 */

#include <stdexcept>
#include <string>

namespace harbor::core::downloader {

enum class ErrorCode {
    AlreadyInProgress,   // enqueue of an id that is active or queued
    NotFound,            // control operation on an unknown id
    InvalidTransition,   // operation not allowed in the item's current state
    TransferError,       // network or destination failure, terminal for the attempt
    PersistenceError,    // durable read/write failure, logged only
    PermissionDenied     // gallery export declined, logged only
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::AlreadyInProgress: return "AlreadyInProgress";
        case ErrorCode::NotFound:          return "NotFound";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
        case ErrorCode::TransferError:     return "TransferError";
        case ErrorCode::PersistenceError:  return "PersistenceError";
        case ErrorCode::PermissionDenied:  return "PermissionDenied";
    }
    return "Unknown";
}

/**
 * DownloadError - thrown synchronously by scheduler control operations
 */
class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

} // namespace harbor::core::downloader
