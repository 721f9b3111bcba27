#include "common/compression.hpp"
#include "common/errors.hpp"

std::string archiveExtension(CompressionMode mode) {
    switch (mode) {
        case CompressionMode::STORE: return "tar";
        case CompressionMode::GZ:    return "tar.gz";
        case CompressionMode::BZ2:   return "tar.bz2";
        case CompressionMode::XZ:    return "tar.xz";
        case CompressionMode::NONE:
        default:                     return "";
    }
}

nlohmann::json compressionToJson(CompressionMode mode) {
    if (mode == CompressionMode::NONE) {
        return nullptr;
    }
    return compressionToString(mode);
}

CompressionMode compressionFromJson(const nlohmann::json& value) {
    if (value.is_null()) {
        return CompressionMode::NONE;
    }
    if (!value.is_string()) {
        throw ConfigError("compression must be a string or null, got " + value.dump());
    }

    const std::string name = value.get<std::string>();
    if (name == "none") {
        return CompressionMode::NONE;
    }
    if (name == "tar" || name == "store") {
        return CompressionMode::STORE;
    }
    if (name == "gz") {
        return CompressionMode::GZ;
    }
    if (name == "bz2") {
        return CompressionMode::BZ2;
    }
    if (name == "xz") {
        return CompressionMode::XZ;
    }
    throw ConfigError("unknown compression: " + name);
}

std::string compressionToString(CompressionMode mode) {
    switch (mode) {
        case CompressionMode::NONE:  return "none";
        case CompressionMode::STORE: return "tar";
        case CompressionMode::GZ:    return "gz";
        case CompressionMode::BZ2:   return "bz2";
        case CompressionMode::XZ:    return "xz";
        default:                     return "unknown";
    }
}
