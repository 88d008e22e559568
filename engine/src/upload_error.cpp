#include "upload_error.hpp"

namespace chunkflow::engine {

std::string_view to_string(UploadErrorCode code) {
    switch (code) {
        case UploadErrorCode::kValidationError:
            return "VALIDATION_ERROR";
        case UploadErrorCode::kFileTooLarge:
            return "FILE_TOO_LARGE";
        case UploadErrorCode::kInvalidFileType:
            return "INVALID_FILE_TYPE";
        case UploadErrorCode::kNetworkError:
            return "NETWORK_ERROR";
        case UploadErrorCode::kServerError:
            return "SERVER_ERROR";
        case UploadErrorCode::kChecksumMismatch:
            return "CHECKSUM_MISMATCH";
        case UploadErrorCode::kChunkUploadFailed:
            return "CHUNK_UPLOAD_FAILED";
        case UploadErrorCode::kSessionExpired:
            return "SESSION_EXPIRED";
        case UploadErrorCode::kSessionNotFound:
            return "SESSION_NOT_FOUND";
        case UploadErrorCode::kInvalidState:
            return "INVALID_STATE";
        case UploadErrorCode::kQuotaExceeded:
            return "QUOTA_EXCEEDED";
        case UploadErrorCode::kCancelled:
            return "CANCELLED";
        case UploadErrorCode::kAuthenticationError:
            return "AUTHENTICATION_ERROR";
    }
    return "UNKNOWN";
}

bool is_retryable(UploadErrorCode code) {
    switch (code) {
        case UploadErrorCode::kNetworkError:
        case UploadErrorCode::kServerError:
        case UploadErrorCode::kChecksumMismatch:
            return true;
        default:
            return false;
    }
}

UploadError::UploadError(UploadErrorCode code, const std::string& message, bool recoverable)
    : std::runtime_error(message), code_(code), recoverable_(recoverable) {}

}  // namespace chunkflow::engine
