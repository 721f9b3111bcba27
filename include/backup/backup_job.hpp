#pragma once

#include "common/job.hpp"
#include "common/tar_archive.hpp"
#include "backup/backup_definition.hpp"
#include "backup/hypervisor.hpp"
#include "backup/snapshot_coordinator.hpp"
#include "backup/vm_config.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Backup of the selected disks of one domain.
//
// start() snapshots every disk at once, copies each frozen image into the
// target directory (plain copies or one tar archive), releases each snapshot
// as soon as its disk is copied, and writes <name>.json. Progress is recorded
// in <name>.json.pending after every step so that cleanAborted() can roll an
// interrupted run back, from this process or from a later one.
class BackupJob : public Job {
public:
    // devNames empty selects every disk currently attached. Throws
    // UnknownDiskError for a device the domain does not have.
    BackupJob(std::shared_ptr<Domain> domain,
              std::shared_ptr<SnapshotCoordinatorProvider> provider,
              const std::vector<std::string>& devNames = {},
              const BackupPolicy& overrides = BackupPolicy());

    // Uses already resolved disks as they are.
    BackupJob(std::shared_ptr<Domain> domain,
              std::shared_ptr<SnapshotCoordinatorProvider> provider,
              DiskList disks,
              const BackupPolicy& overrides);

    ~BackupJob() override;

    void start() override;

    // Rolls back whatever the pending ledger says was done: releases
    // snapshots, deletes the partial archive or images, then the ledger.
    // When <name>.json already exists the backup finished, and only the
    // snapshots and the ledger are dealt with. Never throws; failures are
    // logged.
    void cleanAborted();

    // Adds the given devices (every attached one if empty) that are not
    // tracked yet. The attached disk list changes while snapshots are active,
    // so calling this during a backup can pick up overlay files.
    void addDisks(const std::vector<std::string>& devNames = {});

    // Same target directory, compression and level, and same domain.
    bool compatibleWith(const BackupJob& other) const;
    // Takes the disks of other, and its timeout if this job has none.
    void mergeWith(const BackupJob& other);

    // Group defaults, used for every field without an explicit override.
    void applyDefaults(const BackupPolicy& defaults);

    // Job for the interrupted run recorded in ledgerPath, ready for
    // cleanAborted().
    static std::shared_ptr<BackupJob> fromPendingLedger(const std::string& ledgerPath,
                                                        HypervisorConnection& conn,
                                                        std::shared_ptr<SnapshotCoordinatorProvider> provider,
                                                        std::optional<std::chrono::seconds> timeout = std::nullopt);

    std::shared_ptr<Domain> getDomain() const { return domain_; }
    std::string getDomainName() const { return domainName_; }
    std::string getDomainUUID() const { return domainUUID_; }
    DiskList getDisks() const;
    std::vector<std::string> getDevNames() const;

    std::optional<std::string> getTargetDir() const;
    CompressionMode getCompression() const;
    std::optional<int> getCompressionLevel() const;
    std::optional<std::chrono::seconds> getTimeout() const;

    void setTargetDir(const std::string& targetDir);
    void setCompression(CompressionMode compression, std::optional<int> level = std::nullopt);
    void setTimeout(std::chrono::seconds timeout);

    bool hasPendingLedger() const;
    std::optional<PendingLedger> getPendingLedger() const;

    // Definition skeleton for a new run: identity fields, no disks yet.
    BackupDefinition getDefinition() const;

private:
    DiskList resolveDisks(const std::vector<std::string>& devNames) const;

    void snapshotAndSaveDate(const DiskList& disks, BackupDefinition& definition);
    std::unique_ptr<TarArchive> openArchive(BackupDefinition& definition);
    void backupDisk(const DiskSelection& disk, TarArchive* archive, BackupDefinition& definition);
    void dumpDefinition(const BackupDefinition& definition);

    void dumpPendingLedger();
    void removePendingLedger();
    std::string getCompletePathOf(const std::string& filename) const;

    bool releaseSnapshots();
    bool hasCompletedDefinition(const PendingLedger& ledger) const;
    void cleanAbortedArchive();
    void cleanAbortedImages();

    std::shared_ptr<Domain> domain_;
    std::string domainName_;
    std::string domainUUID_;
    std::shared_ptr<SnapshotCoordinatorProvider> provider_;
    std::unique_ptr<SnapshotCoordinator> coordinator_;

    DiskList disks_;
    BackupPolicy overrides_;
    BackupPolicy defaults_;
    std::optional<PendingLedger> pending_;
    std::string pendingLedgerPath_;
    mutable std::mutex configMutex_;
};
