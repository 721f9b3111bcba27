#include "backup/backup_job.hpp"
#include "backup/kvm/domain_disks.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include "common/version.hpp"
#include <filesystem>
#include <functional>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace {

// Runs a callback when leaving the enclosing scope.
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> callback) : callback_(std::move(callback)) {}
    ~ScopeExit() { callback_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    std::function<void()> callback_;
};

} // namespace

BackupJob::BackupJob(std::shared_ptr<Domain> domain,
                     std::shared_ptr<SnapshotCoordinatorProvider> provider,
                     const std::vector<std::string>& devNames,
                     const BackupPolicy& overrides)
    : domain_(std::move(domain))
    , provider_(std::move(provider))
    , overrides_(overrides) {
    if (domain_) {
        domainName_ = domain_->getName();
        domainUUID_ = domain_->getUUID();
        disks_ = resolveDisks(devNames);
    }
}

BackupJob::BackupJob(std::shared_ptr<Domain> domain,
                     std::shared_ptr<SnapshotCoordinatorProvider> provider,
                     DiskList disks,
                     const BackupPolicy& overrides)
    : domain_(std::move(domain))
    , provider_(std::move(provider))
    , disks_(std::move(disks))
    , overrides_(overrides) {
    if (domain_) {
        domainName_ = domain_->getName();
        domainUUID_ = domain_->getUUID();
    }
}

BackupJob::~BackupJob() = default;

void BackupJob::start() {
    if (!tryMarkRunning()) {
        throw AlreadyRunningError(domainName_);
    }
    ScopeExit running([this]() { clearRunning(); });

    if (!domain_) {
        throw PreconditionError("backup job has no domain");
    }
    if (!provider_) {
        throw PreconditionError(domainName_ + ": no snapshot provider set");
    }
    std::optional<std::string> targetDir = getTargetDir();
    if (!targetDir || targetDir->empty()) {
        throw PreconditionError(domainName_ + ": no target directory set");
    }
    if (hasPendingLedger()) {
        throw PreconditionError(domainName_ + ": an interrupted backup must be cleaned first");
    }
    DiskList disks = getDisks();
    if (disks.empty()) {
        throw PreconditionError(domainName_ + ": no disk selected");
    }

    std::error_code ec;
    fs::create_directories(*targetDir, ec);
    if (ec) {
        throw PreconditionError(domainName_ + ": cannot create " + *targetDir + ": " + ec.message());
    }

    Logger::info(domainName_ + ": starting backup of " + std::to_string(disks.size()) +
                 " disk(s) to " + *targetDir);
    setError("");
    updateProgress(0);

    std::unique_ptr<TarArchive> archive;
    try {
        BackupDefinition definition = getDefinition();
        coordinator_ = provider_->createFresh(domain_, disks, getTimeout());

        setState(State::SNAPSHOTTING);
        snapshotAndSaveDate(disks, definition);

        if (isArchiving(definition.compression)) {
            archive = openArchive(definition);
        }

        setState(State::EXTRACTING);
        size_t done = 0;
        for (const auto& disk : disks) {
            backupDisk(disk, archive.get(), definition);
            ++done;
            updateProgress(static_cast<int>(done * 100 / disks.size()));
        }

        setState(State::FINALIZING);
        if (archive) {
            archive->close();
            archive.reset();
        }
        coordinator_->clean();
        coordinator_.reset();
        dumpDefinition(definition);
        removePendingLedger();

        setState(State::DONE);
        Logger::info(domainName_ + ": backup completed");
    } catch (...) {
        std::string message = describeException(std::current_exception());
        Logger::error(domainName_ + ": backup failed: " + message);
        setError(message);
        archive.reset();
        cleanAborted();
        throw;
    }
}

void BackupJob::cleanAborted() {
    setState(State::ABORTING);

    bool released = releaseSnapshots();
    std::optional<PendingLedger> ledger = getPendingLedger();
    if (ledger) {
        if (hasCompletedDefinition(*ledger)) {
            // Interrupted after the definition was written: the backup is complete
            Logger::warning(domainName_ + ": " + pendingLedgerPath_ +
                            " outlived a completed backup, keeping its files");
        } else if (ledger->archiveFilename) {
            cleanAbortedArchive();
        } else {
            cleanAbortedImages();
        }

        if (released) {
            removePendingLedger();
        } else {
            Logger::warning(domainName_ + ": keeping " + pendingLedgerPath_ +
                            " until its snapshots are released");
        }
    }

    setState(State::CLEANED);
}

void BackupJob::addDisks(const std::vector<std::string>& devNames) {
    DiskList resolved = resolveDisks(devNames);

    std::lock_guard<std::mutex> lock(configMutex_);
    for (const auto& disk : resolved) {
        if (!findDisk(disks_, disk.devName)) {
            disks_.push_back(disk);
        }
    }
}

bool BackupJob::compatibleWith(const BackupJob& other) const {
    return domainUUID_ == other.domainUUID_ &&
           getTargetDir() == other.getTargetDir() &&
           getCompression() == other.getCompression() &&
           getCompressionLevel() == other.getCompressionLevel();
}

void BackupJob::mergeWith(const BackupJob& other) {
    std::vector<std::string> devNames = other.getDevNames();
    std::optional<std::chrono::seconds> otherTimeout;
    {
        std::lock_guard<std::mutex> lock(other.configMutex_);
        otherTimeout = other.overrides_.timeout;
    }

    if (!devNames.empty()) {
        addDisks(devNames);
    }

    std::lock_guard<std::mutex> lock(configMutex_);
    if (!overrides_.timeout && otherTimeout) {
        overrides_.timeout = otherTimeout;
    }
}

void BackupJob::applyDefaults(const BackupPolicy& defaults) {
    std::lock_guard<std::mutex> lock(configMutex_);
    defaults_ = defaults;
}

std::shared_ptr<BackupJob> BackupJob::fromPendingLedger(const std::string& ledgerPath,
                                                        HypervisorConnection& conn,
                                                        std::shared_ptr<SnapshotCoordinatorProvider> provider,
                                                        std::optional<std::chrono::seconds> timeout) {
    PendingLedger ledger = PendingLedger::load(ledgerPath);
    std::shared_ptr<Domain> domain = conn.lookupDomainByName(ledger.domainName);

    DiskList disks;
    for (const auto& disk : ledger.disks) {
        disks.push_back(DiskSelection{disk.first, disk.second.src, ""});
    }

    BackupPolicy overrides;
    overrides.targetDir = fs::absolute(ledgerPath).parent_path().string();
    overrides.compression = ledger.compression;
    overrides.compressionLevel = ledger.compressionLevel;
    overrides.timeout = timeout;

    auto job = std::make_shared<BackupJob>(domain, std::move(provider), std::move(disks), overrides);
    job->pending_ = std::move(ledger);
    job->pendingLedgerPath_ = ledgerPath;
    return job;
}

DiskList BackupJob::getDisks() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return disks_;
}

std::vector<std::string> BackupJob::getDevNames() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    std::vector<std::string> devNames;
    for (const auto& disk : disks_) {
        devNames.push_back(disk.devName);
    }
    return devNames;
}

std::optional<std::string> BackupJob::getTargetDir() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return overrides_.targetDir ? overrides_.targetDir : defaults_.targetDir;
}

CompressionMode BackupJob::getCompression() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (overrides_.compression) {
        return *overrides_.compression;
    }
    return defaults_.compression.value_or(CompressionMode::STORE);
}

std::optional<int> BackupJob::getCompressionLevel() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return overrides_.compressionLevel ? overrides_.compressionLevel : defaults_.compressionLevel;
}

std::optional<std::chrono::seconds> BackupJob::getTimeout() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return overrides_.timeout ? overrides_.timeout : defaults_.timeout;
}

void BackupJob::setTargetDir(const std::string& targetDir) {
    std::lock_guard<std::mutex> lock(configMutex_);
    overrides_.targetDir = targetDir;
}

void BackupJob::setCompression(CompressionMode compression, std::optional<int> level) {
    std::lock_guard<std::mutex> lock(configMutex_);
    overrides_.compression = compression;
    overrides_.compressionLevel = level;
}

void BackupJob::setTimeout(std::chrono::seconds timeout) {
    std::lock_guard<std::mutex> lock(configMutex_);
    overrides_.timeout = timeout;
}

bool BackupJob::hasPendingLedger() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return pending_.has_value();
}

std::optional<PendingLedger> BackupJob::getPendingLedger() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return pending_;
}

BackupDefinition BackupJob::getDefinition() const {
    BackupDefinition definition;
    definition.compression = getCompression();
    definition.compressionLevel = getCompressionLevel();
    definition.domainId = domain_->getId();
    definition.domainName = domainName_;
    definition.domainXml = domain_->getXMLDesc();
    definition.version = VIRTBACKUP_VERSION;
    return definition;
}

DiskList BackupJob::resolveDisks(const std::vector<std::string>& devNames) const {
    DiskList current = getDomainDisks(domain_->getXMLDesc());
    if (current.empty()) {
        throw PreconditionError(domainName_ + ": domain has no disk");
    }
    if (devNames.empty()) {
        return current;
    }

    DiskList selected;
    std::set<std::string> seen;
    for (const auto& devName : devNames) {
        const DiskSelection* disk = findDisk(current, devName);
        if (!disk) {
            throw UnknownDiskError(domainName_, devName);
        }
        if (seen.insert(devName).second) {
            selected.push_back(*disk);
        }
    }
    return selected;
}

void BackupJob::snapshotAndSaveDate(const DiskList& disks, BackupDefinition& definition) {
    Logger::info(domainName_ + ": taking snapshot of " + std::to_string(disks.size()) + " disk(s)");
    SnapshotMetadata metadata = coordinator_->start();
    definition.date = metadata.date;

    PendingLedger ledger;
    static_cast<BackupIdentity&>(ledger) = definition;
    for (const auto& disk : metadata.disks) {
        ledger.disks[disk.first] = PendingDisk{disk.second.src, disk.second.snapshot, std::nullopt};
    }

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        pending_ = std::move(ledger);
    }
    pendingLedgerPath_ = getCompletePathOf(
        formatBackupName(metadata.date, definition.domainId, domainName_) + PENDING_LEDGER_SUFFIX);
    dumpPendingLedger();
}

std::unique_ptr<TarArchive> BackupJob::openArchive(BackupDefinition& definition) {
    std::string filename = formatBackupName(*definition.date, definition.domainId, domainName_) +
                           "." + archiveExtension(definition.compression);
    auto archive = TarArchive::create(getCompletePathOf(filename),
                                      definition.compression,
                                      definition.compressionLevel);
    definition.archiveFilename = filename;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        pending_->archiveFilename = filename;
    }
    dumpPendingLedger();
    return archive;
}

void BackupJob::backupDisk(const DiskSelection& disk, TarArchive* archive, BackupDefinition& definition) {
    std::string target = formatDiskBackupName(*definition.date, definition.domainId,
                                              domainName_, disk.devName) + "." + disk.format;
    std::string frozenImage;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = pending_->disks.find(disk.devName);
        if (it == pending_->disks.end()) {
            throw SnapshotError(domainName_ + ": no snapshot taken for disk " + disk.devName);
        }
        it->second.target = target;
        frozenImage = it->second.src;
    }
    dumpPendingLedger();

    Logger::info(domainName_ + ": backing up disk " + disk.devName + " to " + target);
    if (archive) {
        archive->addFile(frozenImage, target);
    } else {
        file_utils::copyFile(frozenImage, getCompletePathOf(target));
    }
    definition.disks[disk.devName] = target;
    dumpPendingLedger();

    coordinator_->cleanForDisk(disk.devName);
}

void BackupJob::dumpDefinition(const BackupDefinition& definition) {
    std::string path = getCompletePathOf(
        formatBackupName(*definition.date, definition.domainId, domainName_) + ".json");
    file_utils::writeFileAtomically(path, definition.toJson().dump(4));
    Logger::debug(domainName_ + ": definition written to " + path);
}

void BackupJob::dumpPendingLedger() {
    std::optional<PendingLedger> ledger = getPendingLedger();
    if (ledger) {
        ledger->save(pendingLedgerPath_);
    }
}

void BackupJob::removePendingLedger() {
    if (!pendingLedgerPath_.empty()) {
        file_utils::removeWithErrorLogging(pendingLedgerPath_);
    }
    std::lock_guard<std::mutex> lock(configMutex_);
    pending_.reset();
    pendingLedgerPath_.clear();
}

std::string BackupJob::getCompletePathOf(const std::string& filename) const {
    return file_utils::joinPath(getTargetDir().value_or(""), filename);
}

bool BackupJob::releaseSnapshots() {
    try {
        if (!coordinator_) {
            std::optional<PendingLedger> ledger = getPendingLedger();
            if (!ledger || !ledger->hasSnapshots()) {
                return true;
            }
            if (!provider_) {
                Logger::error(domainName_ + ": no snapshot provider to release recorded snapshots");
                return false;
            }

            std::map<std::string, DiskSnapshot> snapshots;
            for (const auto& disk : ledger->disks) {
                snapshots[disk.first] = DiskSnapshot{disk.second.src, disk.second.snapshot};
            }
            coordinator_ = provider_->createForRecovery(domain_, snapshots, getTimeout());
        }

        coordinator_->clean();
        coordinator_.reset();
        return true;
    } catch (const std::exception& e) {
        Logger::error(domainName_ + ": failed to release snapshots: " + e.what());
        return false;
    }
}

bool BackupJob::hasCompletedDefinition(const PendingLedger& ledger) const {
    if (!ledger.date) {
        return false;
    }
    std::error_code ec;
    return fs::exists(getCompletePathOf(
        formatBackupName(*ledger.date, ledger.domainId, ledger.domainName) + ".json"), ec);
}

void BackupJob::cleanAbortedArchive() {
    std::optional<PendingLedger> ledger = getPendingLedger();
    std::string path = getCompletePathOf(*ledger->archiveFilename);
    Logger::info(domainName_ + ": removing partial archive " + path);
    file_utils::removeWithErrorLogging(path);
}

void BackupJob::cleanAbortedImages() {
    std::optional<PendingLedger> ledger = getPendingLedger();
    for (const auto& disk : ledger->disks) {
        if (disk.second.target) {
            std::string path = getCompletePathOf(*disk.second.target);
            Logger::info(domainName_ + ": removing partial image " + path);
            file_utils::removeWithErrorLogging(path);
        }
    }
}
