#pragma once

#include "common/compression.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// One disk of a domain selected for backup.
struct DiskSelection {
    std::string devName;     // Target device name, e.g. "vda"
    std::string sourcePath;  // Image file or block device backing the disk
    std::string format;      // Driver type, e.g. "qcow2", "raw"

    bool operator==(const DiskSelection& other) const {
        return devName == other.devName && sourcePath == other.sourcePath && format == other.format;
    }
};

using DiskList = std::vector<DiskSelection>;

inline const DiskSelection* findDisk(const DiskList& disks, const std::string& devName) {
    for (const auto& disk : disks) {
        if (disk.devName == devName) {
            return &disk;
        }
    }
    return nullptr;
}

// Backup parameters shared by a group of jobs. Every field is nullable so that
// "not set" differs from "set to the same value as the default".
struct BackupPolicy {
    std::optional<std::string> targetDir;
    std::optional<CompressionMode> compression;
    std::optional<int> compressionLevel;
    std::optional<std::chrono::seconds> timeout;  // Wait limit for a block pivot
};
