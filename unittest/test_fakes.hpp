#pragma once

#include "backup/hypervisor.hpp"
#include "backup/snapshot_coordinator.hpp"
#include "backup/vm_config.hpp"
#include "common/errors.hpp"
#include <gtest/gtest.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

class FakeDomain : public Domain {
public:
    FakeDomain(std::string name, std::string uuid, int id, DiskList disks, bool active = true)
        : name_(std::move(name)), uuid_(std::move(uuid)), id_(id), disks_(std::move(disks)), active_(active) {}

    int getId() const override { return id_; }
    std::string getUUID() const override { return uuid_; }
    std::string getName() const override { return name_; }
    bool isActive() const override { return active_; }

    std::string getXMLDesc() const override {
        std::stringstream xml;
        xml << "<domain type='kvm'><name>" << name_ << "</name><uuid>" << uuid_ << "</uuid><devices>";
        for (const auto& disk : disks_) {
            xml << "<disk type='file' device='disk'>"
                << "<driver name='qemu' type='" << disk.format << "'/>"
                << "<source file='" << disk.sourcePath << "'/>"
                << "<target dev='" << disk.devName << "' bus='virtio'/>"
                << "</disk>";
        }
        xml << "<disk type='file' device='cdrom'><target dev='sda' bus='sata'/></disk>";
        xml << "</devices></domain>";
        return xml.str();
    }

private:
    std::string name_;
    std::string uuid_;
    int id_;
    DiskList disks_;
    bool active_;
};

class FakeConnection : public HypervisorConnection {
public:
    void add(const std::shared_ptr<FakeDomain>& domain) { domains_[domain->getName()] = domain; }

    std::shared_ptr<Domain> lookupDomainByName(const std::string& name) override {
        auto it = domains_.find(name);
        if (it == domains_.end()) {
            throw DomainNotFoundError(name);
        }
        return it->second;
    }

    std::set<std::string> listAllDomainNames() override {
        std::set<std::string> names;
        for (const auto& domain : domains_) {
            names.insert(domain.first);
        }
        return names;
    }

private:
    std::map<std::string, std::shared_ptr<FakeDomain>> domains_;
};

// What the fake coordinators did, and how they should misbehave.
struct FakeSnapshotState {
    std::mutex mutex;
    int freshCount = 0;
    int recoveryCount = 0;
    int cleanCalls = 0;
    std::vector<std::string> releasedDisks;
    std::map<std::string, DiskSnapshot> recoveredSnapshots;

    std::chrono::system_clock::time_point date{std::chrono::seconds(1700000000)};
    bool failStart = false;
    bool failClean = false;
    std::string failCleanForDisk;
    std::function<void()> onStart;
};

class FakeSnapshotCoordinator : public SnapshotCoordinator {
public:
    FakeSnapshotCoordinator(std::shared_ptr<FakeSnapshotState> state,
                            DiskList disks,
                            std::map<std::string, DiskSnapshot> snapshots = {})
        : state_(std::move(state)), disks_(std::move(disks)), snapshots_(std::move(snapshots)) {}

    SnapshotMetadata start() override {
        if (state_->onStart) {
            state_->onStart();
        }
        if (state_->failStart) {
            throw SnapshotError("snapshot refused");
        }
        SnapshotMetadata metadata;
        metadata.date = state_->date;
        for (const auto& disk : disks_) {
            snapshots_[disk.devName] = DiskSnapshot{disk.sourcePath, disk.sourcePath + ".overlay"};
        }
        metadata.disks = snapshots_;
        return metadata;
    }

    void cleanForDisk(const std::string& devName) override {
        if (devName == state_->failCleanForDisk) {
            throw SnapshotError("block commit of " + devName + " failed");
        }
        if (snapshots_.erase(devName)) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->releasedDisks.push_back(devName);
        }
    }

    void clean() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cleanCalls++;
        if (state_->failClean) {
            throw SnapshotError("pivot failed");
        }
        for (const auto& snapshot : snapshots_) {
            state_->releasedDisks.push_back(snapshot.first);
        }
        snapshots_.clear();
    }

private:
    std::shared_ptr<FakeSnapshotState> state_;
    DiskList disks_;
    std::map<std::string, DiskSnapshot> snapshots_;
};

class FakeSnapshotProvider : public SnapshotCoordinatorProvider {
public:
    FakeSnapshotProvider() : state_(std::make_shared<FakeSnapshotState>()) {}

    std::unique_ptr<SnapshotCoordinator> createFresh(
        const std::shared_ptr<Domain>&,
        const DiskList& disks,
        std::optional<std::chrono::seconds>) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->freshCount++;
        return std::make_unique<FakeSnapshotCoordinator>(state_, disks);
    }

    std::unique_ptr<SnapshotCoordinator> createForRecovery(
        const std::shared_ptr<Domain>&,
        const std::map<std::string, DiskSnapshot>& snapshots,
        std::optional<std::chrono::seconds>) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->recoveryCount++;
        state_->recoveredSnapshots = snapshots;
        return std::make_unique<FakeSnapshotCoordinator>(state_, DiskList(), snapshots);
    }

    FakeSnapshotState& state() { return *state_; }

private:
    std::shared_ptr<FakeSnapshotState> state_;
};

// Fresh directory under the system temp dir, removed with the fixture.
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir_ = std::filesystem::temp_directory_path() /
                   ("virtbackup_" + std::string(info->test_suite_name()) + "_" + info->name() +
                    "_" + std::to_string(getpid()));
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tempDir_, ec);
    }

    std::string path(const std::string& name) const { return (tempDir_ / name).string(); }

    static void writeFile(const std::string& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    static std::string readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    std::vector<std::string> listFiles() const {
        std::vector<std::string> names;
        for (const auto& entry : std::filesystem::directory_iterator(tempDir_)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    std::filesystem::path tempDir_;
};
