#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace chunkflow::engine {

enum class UploadErrorCode {
    kValidationError,
    kFileTooLarge,
    kInvalidFileType,
    kNetworkError,
    kServerError,
    kChecksumMismatch,
    kChunkUploadFailed,
    kSessionExpired,
    kSessionNotFound,
    kInvalidState,
    kQuotaExceeded,
    kCancelled,
    kAuthenticationError,
};

std::string_view to_string(UploadErrorCode code);

// Only transport-level failures are absorbed by the per-chunk retry loop.
bool is_retryable(UploadErrorCode code);

class UploadError : public std::runtime_error {
public:
    UploadError(UploadErrorCode code, const std::string& message, bool recoverable = false);

    UploadErrorCode code() const noexcept { return code_; }
    bool recoverable() const noexcept { return recoverable_; }

private:
    UploadErrorCode code_;
    bool recoverable_;
};

// What the failure event carries to subscribers.
struct UploadFailure {
    UploadErrorCode code = UploadErrorCode::kServerError;
    std::string message;
    bool recoverable = false;
};

inline UploadFailure to_failure(const UploadError& error) {
    return UploadFailure{error.code(), error.what(), error.recoverable()};
}

}  // namespace chunkflow::engine
