#pragma once

#include "common/logger.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Contents of the JSON configuration file.
struct AppConfig {
    std::string uri = "qemu:///system";
    std::string username;
    std::string password;
    size_t threads = 1;  // 1 runs the jobs of a group one after another
    std::string logPath = "/var/log/virtbackup.log";
    LogLevel logLevel = LogLevel::INFO;
    nlohmann::json groups = nlohmann::json::object();

    // Throws ConfigError on a missing file, malformed JSON or wrong types.
    static AppConfig load(const std::string& path);
    static AppConfig fromJson(const nlohmann::json& json);
};
