#include "backup/job_group.hpp"
#include "backup/pending_recovery.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include "common/parallel_task_manager.hpp"
#include <algorithm>
#include <future>
#include <utility>

JobGroup::JobGroup(std::string name,
                   std::shared_ptr<SnapshotCoordinatorProvider> provider,
                   const BackupPolicy& defaultPolicy)
    : name_(std::move(name))
    , provider_(std::move(provider))
    , defaultPolicy_(defaultPolicy) {
}

BackupPolicy JobGroup::getDefaultPolicy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultPolicy_;
}

void JobGroup::setDefaultPolicy(const BackupPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultPolicy_ = policy;
}

std::shared_ptr<BackupJob> JobGroup::addDomain(const std::shared_ptr<Domain>& domain,
                                               const std::optional<std::vector<std::string>>& disks) {
    std::vector<std::string> devNames = disks.value_or(std::vector<std::string>());
    auto job = std::make_shared<BackupJob>(domain, provider_, devNames);
    return addJob(job);
}

std::shared_ptr<BackupJob> JobGroup::addJob(const std::shared_ptr<BackupJob>& job) {
    std::lock_guard<std::mutex> lock(mutex_);

    job->applyDefaults(defaultsFor(*job));
    auto existing = std::find_if(jobs_.begin(), jobs_.end(), [&job](const std::shared_ptr<BackupJob>& candidate) {
        return candidate->getDomainUUID() == job->getDomainUUID();
    });
    if (existing == jobs_.end()) {
        jobs_.push_back(job);
        Logger::debug(name_ + ": added job for " + job->getDomainName());
        return job;
    }

    if (*existing != job) {
        if (!(*existing)->compatibleWith(*job)) {
            Logger::warning(name_ + ": " + job->getDomainName() +
                            ": merging jobs with different policies, keeping the existing one");
        }
        (*existing)->mergeWith(*job);
    }
    return *existing;
}

std::vector<std::shared_ptr<BackupJob>> JobGroup::search(const Domain& domain) const {
    std::string uuid = domain.getUUID();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<BackupJob>> matches;
    for (const auto& job : jobs_) {
        if (job->getDomainUUID() == uuid) {
            matches.push_back(job);
        }
    }
    return matches;
}

std::shared_ptr<BackupJob> JobGroup::getJob(const Domain& domain) const {
    auto matches = search(domain);
    if (matches.empty()) {
        throw JobNotFoundError(domain.getName());
    }
    return matches.front();
}

std::vector<std::shared_ptr<BackupJob>> JobGroup::getJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_;
}

void JobGroup::propagateDefaultPolicy() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& job : jobs_) {
        job->applyDefaults(defaultsFor(*job));
    }
}

void JobGroup::start() {
    auto jobs = getJobs();
    Logger::info(name_ + ": starting " + std::to_string(jobs.size()) + " backup(s)");

    std::vector<JobFailure> failures;
    for (const auto& job : jobs) {
        try {
            job->start();
        } catch (...) {
            failures.push_back(JobFailure{job, std::current_exception()});
        }
    }
    throwIfFailed(std::move(failures));
}

void JobGroup::startConcurrent(size_t maxWorkers) {
    auto jobs = getJobs();
    maxWorkers = std::max<size_t>(1, std::min(maxWorkers, jobs.size()));
    Logger::info(name_ + ": starting " + std::to_string(jobs.size()) + " backup(s) on " +
                 std::to_string(maxWorkers) + " worker(s)");

    std::vector<JobFailure> failures;
    {
        ParallelTaskManager pool(maxWorkers);
        std::vector<std::future<void>> results;
        for (const auto& job : jobs) {
            results.push_back(pool.addTask([job]() { job->start(); }));
        }

        for (size_t i = 0; i < results.size(); ++i) {
            try {
                results[i].get();
            } catch (...) {
                failures.push_back(JobFailure{jobs[i], std::current_exception()});
            }
        }
    }
    throwIfFailed(std::move(failures));
}

size_t JobGroup::cleanAborted(HypervisorConnection& conn) {
    size_t cleaned = 0;
    for (const auto& job : getJobs()) {
        auto targetDir = job->getTargetDir();
        if (!targetDir) {
            continue;
        }
        cleaned += cleanPendingBackups(*targetDir, conn, provider_, job->getDomainName(), job->getTimeout());
    }
    return cleaned;
}

BackupPolicy JobGroup::defaultsFor(const BackupJob& job) const {
    BackupPolicy defaults = defaultPolicy_;
    if (defaults.targetDir) {
        defaults.targetDir = file_utils::joinPath(*defaults.targetDir, job.getDomainName());
    }
    return defaults;
}

void JobGroup::throwIfFailed(std::vector<JobFailure> failures) const {
    if (failures.empty()) {
        Logger::info(name_ + ": all backups completed");
        return;
    }
    Logger::error(name_ + ": " + std::to_string(failures.size()) + " backup(s) failed");
    throw GroupBackupFailureError(name_, std::move(failures));
}
