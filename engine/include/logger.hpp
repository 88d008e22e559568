#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace chunkflow::engine {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

// Accepts debug, info, warn or error; anything else throws std::invalid_argument.
LogLevel parse_log_level(std::string_view text);
std::string_view to_string(LogLevel level);

// Line-oriented log shared by every engine component:
//   2024-05-01 12:00:00.123 [WARN] message
class Logger {
public:
    // An empty file_path logs to the console only; echo=false silences the console.
    explicit Logger(const std::string& file_path, LogLevel min_level = LogLevel::kInfo, bool echo = true);

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::kDebug, message); }
    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

    const std::string& file_path() const { return file_path_; }

private:
    std::mutex mutex_;
    std::ofstream file_;
    std::string file_path_;
    LogLevel min_level_;
    bool echo_;
};

}  // namespace chunkflow::engine
