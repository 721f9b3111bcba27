#pragma once

#include "backup/backup_job.hpp"
#include "backup/hypervisor.hpp"
#include "backup/snapshot_coordinator.hpp"
#include "backup/vm_config.hpp"
#include "common/errors.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Named set of backup jobs sharing a default policy, at most one job per
// domain (by UUID). A job without its own target directory writes to
// <default target>/<domain name>. A failing job never stops its siblings; start() and
// startConcurrent() report every failure at once in a GroupBackupFailureError.
class JobGroup {
public:
    JobGroup(std::string name,
             std::shared_ptr<SnapshotCoordinatorProvider> provider,
             const BackupPolicy& defaultPolicy = BackupPolicy());

    const std::string& getName() const { return name_; }

    BackupPolicy getDefaultPolicy() const;
    void setDefaultPolicy(const BackupPolicy& policy);

    // Creates a job for domain with the group defaults, or merges the disks
    // into the existing job for that domain. No disks means every disk.
    std::shared_ptr<BackupJob> addDomain(const std::shared_ptr<Domain>& domain,
                                         const std::optional<std::vector<std::string>>& disks = std::nullopt);

    // Adds job, or merges it into the existing job for the same domain and
    // returns that one.
    std::shared_ptr<BackupJob> addJob(const std::shared_ptr<BackupJob>& job);

    std::vector<std::shared_ptr<BackupJob>> search(const Domain& domain) const;
    // Throws JobNotFoundError.
    std::shared_ptr<BackupJob> getJob(const Domain& domain) const;

    std::vector<std::shared_ptr<BackupJob>> getJobs() const;

    // Re-applies the default policy; explicit job overrides are kept.
    void propagateDefaultPolicy();

    // Runs every job in insertion order.
    void start();
    // Runs every job on a pool of maxWorkers threads.
    void startConcurrent(size_t maxWorkers);

    // Cleans the interrupted backups of this group's domains found in their
    // target directories. Returns the number of ledgers processed.
    size_t cleanAborted(HypervisorConnection& conn);

private:
    // Must be called with mutex_ held.
    BackupPolicy defaultsFor(const BackupJob& job) const;
    void throwIfFailed(std::vector<JobFailure> failures) const;

    std::string name_;
    std::shared_ptr<SnapshotCoordinatorProvider> provider_;
    BackupPolicy defaultPolicy_;
    std::vector<std::shared_ptr<BackupJob>> jobs_;
    mutable std::mutex mutex_;
};
