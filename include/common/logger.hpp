#pragma once

#include <string>
#include <mutex>
#include <cstdio>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Process-wide logger writing to the console and to an append-only file.
// Calls made before initialize() are dropped, so library code can log freely.
class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);

    // Accepts "debug", "info", "warning", "error", "fatal" in any case.
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    static void log(LogLevel level, const std::string& message);
    static std::string levelToString(LogLevel level);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static std::string logPath_;
    static FILE* logFile_;
};
