#include "upload_types.hpp"

namespace chunkflow::engine {

std::string_view to_string(Category category) {
    switch (category) {
        case Category::kDocument:
            return "document";
        case Category::kImage:
            return "image";
        case Category::kVideo:
            return "video";
        case Category::kNda:
            return "nda";
    }
    return "document";
}

std::optional<Category> parse_category(std::string_view text) {
    if (text == "document") {
        return Category::kDocument;
    }
    if (text == "image") {
        return Category::kImage;
    }
    if (text == "video") {
        return Category::kVideo;
    }
    if (text == "nda") {
        return Category::kNda;
    }
    return std::nullopt;
}

std::string_view to_string(Priority priority) {
    switch (priority) {
        case Priority::kLow:
            return "low";
        case Priority::kNormal:
            return "normal";
        case Priority::kHigh:
            return "high";
    }
    return "normal";
}

std::optional<Priority> parse_priority(std::string_view text) {
    if (text == "low") {
        return Priority::kLow;
    }
    if (text == "normal") {
        return Priority::kNormal;
    }
    if (text == "high") {
        return Priority::kHigh;
    }
    return std::nullopt;
}

std::string_view to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::kInitializing:
            return "initializing";
        case UploadStatus::kUploading:
            return "uploading";
        case UploadStatus::kPaused:
            return "paused";
        case UploadStatus::kCompleted:
            return "completed";
        case UploadStatus::kFailed:
            return "failed";
        case UploadStatus::kCancelled:
            return "cancelled";
    }
    return "failed";
}

std::optional<UploadStatus> parse_status(std::string_view text) {
    for (auto status : {UploadStatus::kInitializing, UploadStatus::kUploading, UploadStatus::kPaused,
                        UploadStatus::kCompleted, UploadStatus::kFailed, UploadStatus::kCancelled}) {
        if (to_string(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

bool is_terminal(UploadStatus status) {
    return status == UploadStatus::kCompleted || status == UploadStatus::kFailed ||
           status == UploadStatus::kCancelled;
}

std::int64_t to_epoch_ms(TimePoint point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

}  // namespace chunkflow::engine
