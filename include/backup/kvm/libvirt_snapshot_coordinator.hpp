#pragma once

#include "backup/snapshot_coordinator.hpp"
#include "backup/kvm/libvirt_connection.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

// Decides from successive block job readings when an active commit can pivot.
// A commit with nothing to copy reports 0/0, which is also what a job that has
// not computed its length yet reports, so an empty reading counts only once it
// is seen a second time.
class BlockCommitReadiness {
public:
    bool update(unsigned long long cur, unsigned long long end, bool exists);

private:
    unsigned emptyReadings_{0};
};

// External, disk-only snapshots through libvirt. Running domains are released
// with an active block commit followed by a pivot; stopped domains get an
// offline `qemu-img commit` and their disk source redefined.
class LibvirtSnapshotCoordinator : public SnapshotCoordinator {
public:
    LibvirtSnapshotCoordinator(std::shared_ptr<LibvirtDomain> domain,
                               DiskList disks,
                               std::optional<std::chrono::seconds> timeout);

    // Recovery form: only knows the overlays left by an interrupted run.
    LibvirtSnapshotCoordinator(std::shared_ptr<LibvirtDomain> domain,
                               std::map<std::string, DiskSnapshot> snapshots,
                               std::optional<std::chrono::seconds> timeout);

    SnapshotMetadata start() override;
    void cleanForDisk(const std::string& devName) override;
    void clean() override;

    std::string generateSnapshotXml() const;

private:
    void blockCommitAndPivot(const std::string& devName, const DiskSnapshot& snapshot);
    void offlineCommit(const std::string& devName, const DiskSnapshot& snapshot);
    // Polls the block job of devName until ready(cur, end, exists) is true.
    template<typename Ready>
    void waitForBlockJob(const std::string& devName, Ready ready, const char* what);

    std::shared_ptr<LibvirtDomain> domain_;
    DiskList disks_;
    std::optional<std::chrono::seconds> timeout_;
    std::map<std::string, DiskSnapshot> snapshots_;
};

class LibvirtSnapshotProvider : public SnapshotCoordinatorProvider {
public:
    std::unique_ptr<SnapshotCoordinator> createFresh(
        const std::shared_ptr<Domain>& domain,
        const DiskList& disks,
        std::optional<std::chrono::seconds> timeout) override;

    std::unique_ptr<SnapshotCoordinator> createForRecovery(
        const std::shared_ptr<Domain>& domain,
        const std::map<std::string, DiskSnapshot>& snapshots,
        std::optional<std::chrono::seconds> timeout) override;
};
