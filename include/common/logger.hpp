#pragma once

#include <string>
#include <mutex>
#include <chrono>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::DEBUG);
    static void shutdown();
    static void setLogLevel(LogLevel level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static bool isInitialized() { return initialized_; }
    static std::string getLogPath();

    // <dir>/<programName minus extension>_<YYYY-mm-dd_HH-MM-SS>.log
    static std::string sessionLogPath(const std::string& dir,
                                      const std::string& programName,
                                      std::chrono::system_clock::time_point startTime);

    static std::string levelToString(LogLevel level);

private:
    static void log(LogLevel level, const std::string& message);
    static const char* levelColor(LogLevel level);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static std::string logPath_;
};
