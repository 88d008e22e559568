#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chunkflow::engine {

namespace {

std::string format_line(LogLevel level, std::string_view message) {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
         << " [" << to_string(level) << "] " << message << '\n';
    return line.str();
}

}  // namespace

LogLevel parse_log_level(std::string_view text) {
    for (auto level : {LogLevel::kDebug, LogLevel::kInfo, LogLevel::kWarn, LogLevel::kError}) {
        std::string name(to_string(level));
        for (auto& c : name) {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (text == name) {
            return level;
        }
    }
    throw std::invalid_argument("Unknown log level: " + std::string(text));
}

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
    }
    return "INFO";
}

Logger::Logger(const std::string& file_path, LogLevel min_level, bool echo)
    : file_path_(file_path), min_level_(min_level), echo_(echo) {
    if (file_path_.empty()) {
        return;
    }
    const auto directory = std::filesystem::path(file_path_).parent_path();
    if (!directory.empty()) {
        std::filesystem::create_directories(directory);
    }
    file_.open(file_path_, std::ios::app);
    if (!file_) {
        throw std::runtime_error("Failed to open log file: " + file_path_);
    }
}

void Logger::log(LogLevel level, std::string_view message) {
    if (level < min_level_) {
        return;
    }
    const auto line = format_line(level, message);
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    }
    if (echo_) {
        std::clog << line;
    }
}

}  // namespace chunkflow::engine
