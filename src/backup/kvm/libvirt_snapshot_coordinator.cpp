#include "backup/kvm/libvirt_snapshot_coordinator.hpp"
#include "backup/kvm/domain_disks.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include <libvirt/virterror.h>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <thread>
#include <vector>
#include <sys/wait.h>

namespace {

constexpr auto BLOCK_JOB_POLL_INTERVAL = std::chrono::milliseconds(500);

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string getInactiveXml(virDomainPtr dom) {
    char* xml = virDomainGetXMLDesc(dom, VIR_DOMAIN_XML_INACTIVE);
    if (!xml) {
        throw HypervisorError("Failed to get inactive domain XML: " + lastLibvirtError());
    }
    std::string result(xml);
    free(xml);
    return result;
}

} // namespace

LibvirtSnapshotCoordinator::LibvirtSnapshotCoordinator(std::shared_ptr<LibvirtDomain> domain,
                                                       DiskList disks,
                                                       std::optional<std::chrono::seconds> timeout)
    : domain_(std::move(domain))
    , disks_(std::move(disks))
    , timeout_(timeout) {
}

LibvirtSnapshotCoordinator::LibvirtSnapshotCoordinator(std::shared_ptr<LibvirtDomain> domain,
                                                       std::map<std::string, DiskSnapshot> snapshots,
                                                       std::optional<std::chrono::seconds> timeout)
    : domain_(std::move(domain))
    , timeout_(timeout)
    , snapshots_(std::move(snapshots)) {
}

std::string LibvirtSnapshotCoordinator::generateSnapshotXml() const {
    std::stringstream xml;
    xml << "<domainsnapshot>\n"
        << "  <description>Pre-backup external snapshot</description>\n"
        << "  <disks>\n";
    for (const auto& disk : getDomainDisks(domain_->getXMLDesc())) {
        const bool selected = findDisk(disks_, disk.devName) != nullptr;
        xml << "    <disk name=\"" << disk.devName << "\" snapshot=\""
            << (selected ? "external" : "no") << "\"/>\n";
    }
    xml << "  </disks>\n"
        << "</domainsnapshot>\n";
    return xml.str();
}

SnapshotMetadata LibvirtSnapshotCoordinator::start() {
    const std::string name = domain_->getName();
    if (disks_.empty()) {
        throw SnapshotError(name + ": no disk to snapshot");
    }

    const std::string snapshotXml = generateSnapshotXml();
    unsigned int flags = VIR_DOMAIN_SNAPSHOT_CREATE_DISK_ONLY
                       | VIR_DOMAIN_SNAPSHOT_CREATE_ATOMIC
                       | VIR_DOMAIN_SNAPSHOT_CREATE_NO_METADATA;

    virDomainSnapshotPtr snapshot = nullptr;
    if (domain_->isActive()) {
        snapshot = virDomainSnapshotCreateXML(domain_->getRawHandle(), snapshotXml.c_str(),
                                              flags | VIR_DOMAIN_SNAPSHOT_CREATE_QUIESCE);
        if (!snapshot) {
            Logger::warning(name + ": quiesced snapshot failed (" + lastLibvirtError()
                            + "), retrying without guest agent");
        }
    }
    if (!snapshot) {
        snapshot = virDomainSnapshotCreateXML(domain_->getRawHandle(), snapshotXml.c_str(), flags);
    }
    if (!snapshot) {
        throw SnapshotError(name + ": failed to create external snapshot: " + lastLibvirtError());
    }
    virDomainSnapshotFree(snapshot);

    SnapshotMetadata metadata;
    metadata.date = std::chrono::system_clock::now();

    const std::string currentXml = domain_->getXMLDesc();
    for (const auto& disk : disks_) {
        DiskSnapshot diskSnapshot;
        diskSnapshot.src = disk.sourcePath;
        diskSnapshot.snapshot = getDiskSource(currentXml, disk.devName);
        snapshots_[disk.devName] = diskSnapshot;
        metadata.disks[disk.devName] = diskSnapshot;
        if (diskSnapshot.snapshot.empty() || diskSnapshot.snapshot == diskSnapshot.src) {
            throw SnapshotError(name + ": disk " + disk.devName + " was not redirected to an overlay");
        }
        Logger::debug(name + ": " + disk.devName + " snapshot at " + diskSnapshot.snapshot);
    }
    return metadata;
}

void LibvirtSnapshotCoordinator::cleanForDisk(const std::string& devName) {
    auto it = snapshots_.find(devName);
    if (it == snapshots_.end()) {
        return;
    }
    const DiskSnapshot snapshot = it->second;
    const std::string name = domain_->getName();

    const std::string currentSource = getDiskSource(domain_->getXMLDesc(), devName);
    if (currentSource == snapshot.snapshot) {
        if (domain_->isActive()) {
            blockCommitAndPivot(devName, snapshot);
        } else {
            offlineCommit(devName, snapshot);
        }
    } else {
        Logger::info(name + ": " + devName + " already points to " + currentSource + ", skipping pivot");
    }

    file_utils::removeWithErrorLogging(snapshot.snapshot);
    snapshots_.erase(devName);
    Logger::debug(name + ": snapshot of " + devName + " released");
}

void LibvirtSnapshotCoordinator::clean() {
    std::vector<std::string> devNames;
    for (const auto& entry : snapshots_) {
        devNames.push_back(entry.first);
    }

    std::exception_ptr firstError;
    for (const auto& devName : devNames) {
        try {
            cleanForDisk(devName);
        } catch (const std::exception& e) {
            Logger::error(domain_->getName() + ": failed to release snapshot of " + devName + ": " + e.what());
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
}

template<typename Ready>
void LibvirtSnapshotCoordinator::waitForBlockJob(const std::string& devName, Ready ready, const char* what) {
    const auto deadline = std::chrono::steady_clock::now()
                        + timeout_.value_or(std::chrono::seconds::zero());
    while (true) {
        virDomainBlockJobInfo info;
        int exists = virDomainGetBlockJobInfo(domain_->getRawHandle(), devName.c_str(), &info, 0);
        if (exists < 0) {
            throw SnapshotError(domain_->getName() + ": failed to query block job on " + devName
                                + ": " + lastLibvirtError());
        }
        if (ready(info.cur, info.end, exists == 1)) {
            return;
        }
        if (timeout_ && std::chrono::steady_clock::now() >= deadline) {
            throw SnapshotTimeoutError(domain_->getName() + ": timeout waiting for " + what + " on " + devName);
        }
        std::this_thread::sleep_for(BLOCK_JOB_POLL_INTERVAL);
    }
}

bool BlockCommitReadiness::update(unsigned long long cur, unsigned long long end, bool exists) {
    if (!exists || cur != end) {
        return false;
    }
    if (end > 0) {
        return true;
    }
    return ++emptyReadings_ > 1;
}

void LibvirtSnapshotCoordinator::blockCommitAndPivot(const std::string& devName, const DiskSnapshot& snapshot) {
    virDomainPtr dom = domain_->getRawHandle();
    const std::string name = domain_->getName();

    Logger::debug(name + ": block commit of " + snapshot.snapshot + " into " + snapshot.src);
    if (virDomainBlockCommit(dom, devName.c_str(), nullptr, nullptr, 0,
                             VIR_DOMAIN_BLOCK_COMMIT_ACTIVE) < 0) {
        throw SnapshotError(name + ": block commit failed on " + devName + ": " + lastLibvirtError());
    }

    try {
        BlockCommitReadiness readiness;
        waitForBlockJob(devName, [&readiness](unsigned long long cur, unsigned long long end, bool exists) {
            return readiness.update(cur, end, exists);
        }, "block commit");
    } catch (const SnapshotTimeoutError&) {
        if (virDomainBlockJobAbort(dom, devName.c_str(), 0) < 0) {
            Logger::error(name + ": failed to abort block commit on " + devName + ": " + lastLibvirtError());
        }
        throw;
    }

    if (virDomainBlockJobAbort(dom, devName.c_str(), VIR_DOMAIN_BLOCK_JOB_ABORT_PIVOT) < 0) {
        throw SnapshotError(name + ": pivot failed on " + devName + ": " + lastLibvirtError());
    }
    waitForBlockJob(devName, [](unsigned long long, unsigned long long, bool exists) {
        return !exists;
    }, "pivot");
}

void LibvirtSnapshotCoordinator::offlineCommit(const std::string& devName, const DiskSnapshot& snapshot) {
    const std::string name = domain_->getName();
    const std::string cmd = "qemu-img commit -q " + shellQuote(snapshot.snapshot);
    Logger::debug(name + ": " + cmd);

    int status = std::system(cmd.c_str());
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw SnapshotError(name + ": qemu-img commit failed for " + snapshot.snapshot);
    }

    virDomainPtr dom = domain_->getRawHandle();
    const std::string newXml = setDiskSource(getInactiveXml(dom), devName, snapshot.src);
    virDomainPtr redefined = virDomainDefineXML(virDomainGetConnect(dom), newXml.c_str());
    if (!redefined) {
        throw SnapshotError(name + ": failed to restore source of " + devName + ": " + lastLibvirtError());
    }
    virDomainFree(redefined);
}

std::unique_ptr<SnapshotCoordinator> LibvirtSnapshotProvider::createFresh(
    const std::shared_ptr<Domain>& domain,
    const DiskList& disks,
    std::optional<std::chrono::seconds> timeout) {
    auto libvirtDomain = std::dynamic_pointer_cast<LibvirtDomain>(domain);
    if (!libvirtDomain) {
        throw HypervisorError("Snapshots need a libvirt domain");
    }
    return std::make_unique<LibvirtSnapshotCoordinator>(libvirtDomain, disks, timeout);
}

std::unique_ptr<SnapshotCoordinator> LibvirtSnapshotProvider::createForRecovery(
    const std::shared_ptr<Domain>& domain,
    const std::map<std::string, DiskSnapshot>& snapshots,
    std::optional<std::chrono::seconds> timeout) {
    auto libvirtDomain = std::dynamic_pointer_cast<LibvirtDomain>(domain);
    if (!libvirtDomain) {
        throw HypervisorError("Snapshots need a libvirt domain");
    }
    return std::make_unique<LibvirtSnapshotCoordinator>(libvirtDomain, snapshots, timeout);
}
