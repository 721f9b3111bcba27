#include "common/app_config.hpp"
#include "common/errors.hpp"
#include <fstream>

using json = nlohmann::json;

namespace {

std::string stringField(const json& config, const char* key, const std::string& fallback) {
    if (!config.contains(key) || config[key].is_null()) {
        return fallback;
    }
    if (!config[key].is_string()) {
        throw ConfigError(std::string(key) + " must be a string");
    }
    return config[key].get<std::string>();
}

} // namespace

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file " + path);
    }

    json content;
    try {
        file >> content;
    } catch (const json::parse_error& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }
    return fromJson(content);
}

AppConfig AppConfig::fromJson(const json& config) {
    if (!config.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    AppConfig result;
    result.uri = stringField(config, "uri", result.uri);
    result.username = stringField(config, "username", result.username);
    result.password = stringField(config, "password", result.password);
    result.logPath = stringField(config, "log_path", result.logPath);

    if (config.contains("threads") && !config["threads"].is_null()) {
        if (!config["threads"].is_number_integer() || config["threads"].get<int>() < 1) {
            throw ConfigError("threads must be a positive integer");
        }
        result.threads = config["threads"].get<size_t>();
    }

    std::string level = stringField(config, "log_level", "");
    if (!level.empty() && !Logger::parseLevel(level, result.logLevel)) {
        throw ConfigError("unknown log_level: " + level);
    }

    if (config.contains("groups") && !config["groups"].is_null()) {
        if (!config["groups"].is_object()) {
            throw ConfigError("groups must be an object");
        }
        result.groups = config["groups"];
    }
    return result;
}
