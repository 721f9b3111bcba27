#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstring>  // for strerror
#include <cerrno>   // for errno
#include <ctime>

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
std::string Logger::logPath_;
FILE* Logger::logFile_ = nullptr;

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        std::cerr << "Logger already initialized" << std::endl;
        return false;
    }

    if (!logPath.empty()) {
        try {
            std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
            if (!logDir.empty() && !std::filesystem::exists(logDir)) {
                std::filesystem::create_directories(logDir);
            }
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "Logger initialization failed: " << e.what() << std::endl;
            return false;
        }

        logFile_ = fopen(logPath.c_str(), "a");
        if (!logFile_) {
            std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
            return false;
        }
    }

    logPath_ = logPath;
    currentLevel_ = level;
    initialized_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_) {
        fclose(logFile_);
        logFile_ = nullptr;
    }
    initialized_ = false;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < currentLevel_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << " [" << levelToString(level) << "] " << message << "\n";
    const std::string logMessage = ss.str();

    if (level >= LogLevel::ERROR) {
        std::cerr << logMessage << std::flush;
    } else {
        std::cout << logMessage << std::flush;
    }

    if (logFile_) {
        fputs(logMessage.c_str(), logFile_);
        fflush(logFile_);
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        level = LogLevel::DEBUG;
    } else if (lowered == "info") {
        level = LogLevel::INFO;
    } else if (lowered == "warning" || lowered == "warn") {
        level = LogLevel::WARNING;
    } else if (lowered == "error") {
        level = LogLevel::ERROR;
    } else if (lowered == "fatal") {
        level = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}
