#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class CompressionMode {
    NONE,   // plain copies, no archive
    STORE,  // uncompressed tar
    GZ,
    BZ2,
    XZ
};

inline bool isArchiving(CompressionMode mode) {
    return mode != CompressionMode::NONE;
}

// "tar", "tar.gz", "tar.bz2", "tar.xz"; empty for NONE.
std::string archiveExtension(CompressionMode mode);

// Definition/config spelling: null for NONE, "tar", "gz", "bz2", "xz".
nlohmann::json compressionToJson(CompressionMode mode);

// Accepts null, "none", "tar", "store", "gz", "bz2", "xz". Throws ConfigError.
CompressionMode compressionFromJson(const nlohmann::json& value);

std::string compressionToString(CompressionMode mode);
