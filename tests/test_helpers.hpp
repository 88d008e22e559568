#pragma once

#include "checksum.hpp"
#include "clock.hpp"
#include "event_bus.hpp"
#include "file_source.hpp"
#include "storage_backend.hpp"
#include "upload_error.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chunkflow::testing {

using namespace std::chrono_literals;

class ManualClock : public engine::Clock {
public:
    ManualClock() : now_(engine::from_epoch_ms(1'700'000'000'000)) {}

    engine::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    engine::TimePoint now_;
};

class MemoryFileSource : public engine::FileSource {
public:
    explicit MemoryFileSource(std::vector<std::byte> data, std::string path = {})
        : data_(std::move(data)), path_(std::move(path)) {}

    // Deterministic non-repeating-looking content of the given size.
    static std::shared_ptr<MemoryFileSource> patterned(std::size_t size, std::uint32_t seed = 7) {
        std::vector<std::byte> data(size);
        std::uint32_t state = seed;
        for (auto& b : data) {
            state = state * 1103515245u + 12345u;
            b = static_cast<std::byte>(state >> 24);
        }
        return std::make_shared<MemoryFileSource>(std::move(data));
    }

    std::uint64_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    std::vector<std::byte> read(std::uint64_t offset, std::size_t length) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (offset >= data_.size()) {
            return {};
        }
        const auto end = std::min<std::uint64_t>(offset + length, data_.size());
        return std::vector<std::byte>(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                                      data_.begin() + static_cast<std::ptrdiff_t>(end));
    }

    std::string path() const override { return path_; }

    void overwrite(std::uint64_t offset, std::byte value) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.at(offset) = value;
    }

    std::vector<std::byte> contents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::byte> data_;
    std::string path_;
};

// In-memory multipart store with scriptable failures.
class FakeStorageBackend : public engine::StorageBackend {
public:
    static constexpr std::uint32_t kAlways = std::numeric_limits<std::uint32_t>::max();

    std::string initiate(const std::string& file_key, const std::string&, const engine::Metadata&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++initiates_waiting_;
        initiate_cv_.wait(lock, [this] { return !initiate_held_; });
        --initiates_waiting_;
        ++initiate_calls_;
        if (initiate_failure_) {
            throw engine::UploadError(*initiate_failure_, "scripted initiate failure");
        }
        const auto upload_id = "upload-" + std::to_string(initiate_calls_);
        uploads_[upload_id].file_key = file_key;
        return upload_id;
    }

    engine::PartAck upload_part(const std::string& upload_id,
                                std::uint32_t chunk_index,
                                std::span<const std::byte> bytes,
                                const std::string& checksum,
                                std::chrono::milliseconds) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++attempts_[chunk_index];
        ++waiting_;
        gate_cv_.wait(lock, [this] { return gate_open_; });
        --waiting_;

        auto script = part_failures_.find(chunk_index);
        if (script != part_failures_.end() && script->second.remaining > 0) {
            if (script->second.remaining != kAlways) {
                --script->second.remaining;
            }
            throw engine::UploadError(script->second.code, "scripted failure of part " + std::to_string(chunk_index));
        }
        auto upload = uploads_.find(upload_id);
        if (upload == uploads_.end()) {
            throw engine::UploadError(engine::UploadErrorCode::kServerError, "NoSuchUpload");
        }
        upload->second.parts[chunk_index] = std::vector<std::byte>(bytes.begin(), bytes.end());

        engine::PartAck ack{"\"" + engine::ChecksumComputer::md5(bytes) + "\"", checksum};
        auto corrupt = corrupt_acks_.find(chunk_index);
        if (corrupt != corrupt_acks_.end() && corrupt->second > 0) {
            --corrupt->second;
            ack.checksum = "0000";
        }
        return ack;
    }

    engine::MultipartResult complete_multipart(const std::string& upload_id,
                                               const std::vector<engine::CompletedPart>& parts) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++complete_calls_;
        if (complete_failure_) {
            throw engine::UploadError(*complete_failure_, "scripted completion failure");
        }
        auto upload = uploads_.find(upload_id);
        if (upload == uploads_.end()) {
            throw engine::UploadError(engine::UploadErrorCode::kServerError, "NoSuchUpload");
        }
        completed_parts_ = parts;
        std::vector<std::byte> object;
        for (const auto& part : parts) {
            const auto& bytes = upload->second.parts.at(part.chunk_index);
            object.insert(object.end(), bytes.begin(), bytes.end());
        }
        objects_[upload->second.file_key] = std::move(object);
        const auto key = upload->second.file_key;
        uploads_.erase(upload);
        return engine::MultipartResult{"memory://" + key, std::nullopt};
    }

    void abort_multipart(const std::string& upload_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++abort_calls_;
        if (abort_failures_ > 0) {
            if (abort_failures_ != kAlways) {
                --abort_failures_;
            }
            throw engine::UploadError(engine::UploadErrorCode::kNetworkError, "scripted abort failure");
        }
        uploads_.erase(upload_id);
    }

    void fail_part(std::uint32_t chunk_index, engine::UploadErrorCode code, std::uint32_t times) {
        std::lock_guard<std::mutex> lock(mutex_);
        part_failures_[chunk_index] = PartScript{code, times};
    }

    void clear_part_failures() {
        std::lock_guard<std::mutex> lock(mutex_);
        part_failures_.clear();
    }

    void corrupt_ack(std::uint32_t chunk_index, std::uint32_t times) {
        std::lock_guard<std::mutex> lock(mutex_);
        corrupt_acks_[chunk_index] = times;
    }

    void fail_initiate(engine::UploadErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        initiate_failure_ = code;
    }

    void fail_complete(engine::UploadErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        complete_failure_ = code;
    }

    void fail_abort(std::uint32_t times) {
        std::lock_guard<std::mutex> lock(mutex_);
        abort_failures_ = times;
    }

    // While closed, upload_part blocks after counting the attempt.
    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        gate_cv_.notify_all();
    }

    // While held, initiate blocks before creating the upload.
    void hold_initiate() {
        std::lock_guard<std::mutex> lock(mutex_);
        initiate_held_ = true;
    }

    void release_initiate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            initiate_held_ = false;
        }
        initiate_cv_.notify_all();
    }

    std::size_t initiates_waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return initiates_waiting_;
    }

    std::size_t waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

    std::uint32_t attempts(std::uint32_t chunk_index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(chunk_index);
        return it == attempts_.end() ? 0 : it->second;
    }

    std::uint32_t total_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uint32_t total = 0;
        for (const auto& entry : attempts_) {
            total += entry.second;
        }
        return total;
    }

    int initiate_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return initiate_calls_;
    }

    int complete_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return complete_calls_;
    }

    int abort_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abort_calls_;
    }

    std::vector<engine::CompletedPart> completed_parts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_parts_;
    }

    std::vector<std::byte> object(const std::string& file_key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(file_key);
        return it == objects_.end() ? std::vector<std::byte>{} : it->second;
    }

    bool has_upload(const std::string& upload_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_.count(upload_id) > 0;
    }

private:
    struct PartScript {
        engine::UploadErrorCode code;
        std::uint32_t remaining;
    };

    struct Upload {
        std::string file_key;
        std::map<std::uint32_t, std::vector<std::byte>> parts;
    };

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    bool gate_open_ = true;
    std::size_t waiting_ = 0;
    std::condition_variable initiate_cv_;
    bool initiate_held_ = false;
    std::size_t initiates_waiting_ = 0;

    std::map<std::string, Upload> uploads_;
    std::map<std::string, std::vector<std::byte>> objects_;
    std::map<std::uint32_t, PartScript> part_failures_;
    std::map<std::uint32_t, std::uint32_t> corrupt_acks_;
    std::map<std::uint32_t, std::uint32_t> attempts_;
    std::optional<engine::UploadErrorCode> initiate_failure_;
    std::optional<engine::UploadErrorCode> complete_failure_;
    std::uint32_t abort_failures_ = 0;
    std::vector<engine::CompletedPart> completed_parts_;
    int initiate_calls_ = 0;
    int complete_calls_ = 0;
    int abort_calls_ = 0;
};

// Collects every event delivered by an EventBus.
class EventRecorder {
public:
    explicit EventRecorder(engine::EventBus& bus) : bus_(bus) {
        id_ = bus_.subscribe([this](const engine::UploadEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });
    }

    ~EventRecorder() { bus_.unsubscribe(id_); }

    std::vector<engine::UploadEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<engine::UploadEvent> of_type(engine::UploadEventType type, const std::string& session_id = {}) const {
        std::vector<engine::UploadEvent> matching;
        for (auto& event : events()) {
            if (event.type == type && (session_id.empty() || event.session_id == session_id)) {
                matching.push_back(std::move(event));
            }
        }
        return matching;
    }

private:
    engine::EventBus& bus_;
    engine::EventBus::SubscriptionId id_;
    mutable std::mutex mutex_;
    std::vector<engine::UploadEvent> events_;
};

class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("chunkflow-test-" + engine::random_hex_id(6))) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

inline std::vector<std::byte> bytes_of(const std::string& text) {
    return std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                  reinterpret_cast<const std::byte*>(text.data() + text.size()));
}

}  // namespace chunkflow::testing
