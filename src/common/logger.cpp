#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <filesystem>
#include <cstdio>
#include <cstring>  // for strerror
#include <cerrno>   // for errno
#include <ctime>

namespace {

const char* const kColorReset = "\033[0m";

std::string formatLocalTime(std::chrono::system_clock::time_point point, const char* format) {
    auto time = std::chrono::system_clock::to_time_t(point);
    std::tm tm{};
    localtime_r(&time, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

} // namespace

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::DEBUG;
bool Logger::initialized_ = false;
std::string Logger::logPath_;

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        std::cerr << "Logger already initialized with " << logPath_ << std::endl;
        return false;
    }

    // Create directory if it doesn't exist
    std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
    if (!logDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        if (ec) {
            std::cerr << "Failed to create log directory " << logDir.string()
                      << ": " << ec.message() << std::endl;
            return false;
        }
    }

    // Touch the session file so a failure surfaces before any work starts
    FILE* logFile = fopen(logPath.c_str(), "a");
    if (!logFile) {
        std::cerr << "Failed to create log file " << logPath << ": " << strerror(errno) << std::endl;
        return false;
    }
    fclose(logFile);

    logPath_ = logPath;
    currentLevel_ = level;
    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
    logPath_.clear();
    currentLevel_ = LogLevel::DEBUG;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

std::string Logger::getLogPath() {
    std::lock_guard<std::mutex> lock(mutex_);
    return logPath_;
}

std::string Logger::sessionLogPath(const std::string& dir,
                                   const std::string& programName,
                                   std::chrono::system_clock::time_point startTime) {
    std::string stem = std::filesystem::path(programName).stem().string();
    if (stem.empty()) {
        stem = "user-profile-backup";
    }
    std::string fileName = stem + "_" + formatLocalTime(startTime, "%Y-%m-%d_%H-%M-%S") + ".log";
    return (std::filesystem::path(dir) / fileName).string();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < currentLevel_) {
        return;
    }

    std::string line = formatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S")
                       + " [" + levelToString(level) + "] " + message;

    // Console copy always goes to stderr so stdout stays clean for usage text
    std::cerr << levelColor(level) << line << kColorReset << "\n";
    std::cerr.flush();

    FILE* logFile = fopen(logPath_.c_str(), "a");
    if (logFile) {
        fprintf(logFile, "%s\n", line.c_str());
        fflush(logFile);
        fclose(logFile);
    } else {
        std::cerr << "Failed to open log file: " << strerror(errno) << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

const char* Logger::levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[0;36m";
        case LogLevel::INFO:  return "\033[0;32m";
        case LogLevel::WARN:  return "\033[0;33m";
        case LogLevel::ERROR: return "\033[0;31m";
        default:              return kColorReset;
    }
}
