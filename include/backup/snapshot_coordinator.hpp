#pragma once

#include "backup/hypervisor.hpp"
#include "backup/vm_config.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

// Snapshot overlay created for one disk: writes go to `snapshot` while `src`
// stays frozen and can be copied.
struct DiskSnapshot {
    std::string src;
    std::string snapshot;
};

struct SnapshotMetadata {
    std::chrono::system_clock::time_point date;
    std::map<std::string, DiskSnapshot> disks;
};

// Takes and releases the external snapshots of one backup run.
class SnapshotCoordinator {
public:
    virtual ~SnapshotCoordinator() = default;

    // Snapshots every disk atomically. The returned date is the instant all
    // disks were frozen.
    virtual SnapshotMetadata start() = 0;

    // Merges the overlay of devName back into its base image and removes it.
    // No-op for a disk that is not (or no longer) snapshotted.
    virtual void cleanForDisk(const std::string& devName) = 0;

    // Releases every remaining snapshot. Safe to call more than once.
    virtual void clean() = 0;
};

// Builds coordinators either for a new run or to roll back snapshots recorded
// by an interrupted one.
class SnapshotCoordinatorProvider {
public:
    virtual ~SnapshotCoordinatorProvider() = default;

    virtual std::unique_ptr<SnapshotCoordinator> createFresh(
        const std::shared_ptr<Domain>& domain,
        const DiskList& disks,
        std::optional<std::chrono::seconds> timeout) = 0;

    virtual std::unique_ptr<SnapshotCoordinator> createForRecovery(
        const std::shared_ptr<Domain>& domain,
        const std::map<std::string, DiskSnapshot>& snapshots,
        std::optional<std::chrono::seconds> timeout) = 0;
};
