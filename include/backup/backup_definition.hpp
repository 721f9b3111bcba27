#pragma once

#include "common/compression.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Fields shared by the success record and the pending ledger.
struct BackupIdentity {
    CompressionMode compression{CompressionMode::STORE};
    std::optional<int> compressionLevel;
    int domainId{-1};
    std::string domainName;
    std::string domainXml;
    std::string version;
    // Instant every disk was frozen; unset until the snapshot is taken.
    std::optional<std::chrono::system_clock::time_point> date;
};

// Durable record of a completed backup, written as <name>.json.
struct BackupDefinition : BackupIdentity {
    std::map<std::string, std::string> disks;  // devName -> archived filename
    std::optional<std::string> archiveFilename;

    nlohmann::json toJson() const;
    static BackupDefinition fromJson(const nlohmann::json& json);
};

struct PendingDisk {
    std::string src;
    std::string snapshot;
    std::optional<std::string> target;  // Set before the image is written
};

// Crash-recovery record of a backup in progress, written as <name>.json.pending.
struct PendingLedger : BackupIdentity {
    std::map<std::string, PendingDisk> disks;
    std::optional<std::string> archiveFilename;

    bool hasSnapshots() const { return !disks.empty(); }

    nlohmann::json toJson() const;
    static PendingLedger fromJson(const nlohmann::json& json);

    // Throws ConfigError on unreadable or malformed files.
    static PendingLedger load(const std::string& path);
    void save(const std::string& path) const;
};

extern const char* const PENDING_LEDGER_SUFFIX;  // ".json.pending"

// <YYYYMMDD-HHMMSS>_<domainId>_<domainName>, date in local time.
std::string formatBackupName(std::chrono::system_clock::time_point date,
                             int domainId,
                             const std::string& domainName);

// <backup name>_<devName>
std::string formatDiskBackupName(std::chrono::system_clock::time_point date,
                                 int domainId,
                                 const std::string& domainName,
                                 const std::string& devName);
