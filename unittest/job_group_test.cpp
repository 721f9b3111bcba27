#include <gtest/gtest.h>
#include "backup/backup_definition.hpp"
#include "backup/job_group.hpp"
#include "common/errors.hpp"
#include "test_fakes.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <set>
#include <thread>

namespace fs = std::filesystem;

namespace {

// Tracks how many stub jobs run at the same time.
struct ConcurrencyTracker {
    std::atomic<int> current{0};
    std::atomic<int> peak{0};

    void enter() {
        int now = ++current;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
    }
    void leave() { --current; }
};

// Backup job whose run only records that it happened.
class StubJob : public BackupJob {
public:
    StubJob(std::shared_ptr<Domain> domain,
            std::shared_ptr<SnapshotCoordinatorProvider> provider,
            bool fail,
            std::shared_ptr<ConcurrencyTracker> tracker = nullptr)
        : BackupJob(std::move(domain), std::move(provider),
                    DiskList{DiskSelection{"vda", "/images/vda.qcow2", "qcow2"}}, BackupPolicy())
        , fail_(fail)
        , tracker_(std::move(tracker)) {}

    void start() override {
        ++calls;
        if (tracker_) {
            tracker_->enter();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            tracker_->leave();
        }
        if (fail_) {
            throw SnapshotError(getDomainName() + ": snapshot refused");
        }
    }

    std::atomic<int> calls{0};

private:
    bool fail_;
    std::shared_ptr<ConcurrencyTracker> tracker_;
};

} // namespace

class JobGroupTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        provider_ = std::make_shared<FakeSnapshotProvider>();
        for (int i = 1; i <= 6; ++i) {
            std::string name = "vm" + std::to_string(i);
            auto domain = std::make_shared<FakeDomain>(name, "uuid-" + std::to_string(i), i, DiskList{
                {"vda", "/images/" + name + "-vda.qcow2", "qcow2"},
                {"vdb", "/images/" + name + "-vdb.raw", "raw"}
            });
            domains_.push_back(domain);
            conn_.add(domain);
        }
    }

    std::shared_ptr<FakeDomain> domain(int index) const { return domains_[index - 1]; }

    std::shared_ptr<FakeSnapshotProvider> provider_;
    std::vector<std::shared_ptr<FakeDomain>> domains_;
    FakeConnection conn_;
};

TEST_F(JobGroupTest, AddDomainMergesDisksOfSameDomain) {
    JobGroup group("test", provider_);
    auto first = group.addDomain(domain(1), std::vector<std::string>{"vda"});
    auto second = group.addDomain(domain(1), std::vector<std::string>{"vdb"});

    EXPECT_EQ(first, second);
    ASSERT_EQ(group.getJobs().size(), 1u);
    EXPECT_EQ(first->getDevNames(), (std::vector<std::string>{"vda", "vdb"}));
}

TEST_F(JobGroupTest, DomainIdentityIsTheUUID) {
    JobGroup group("test", provider_);
    group.addDomain(domain(1), std::vector<std::string>{"vda"});

    auto renamed = std::make_shared<FakeDomain>("vm1-renamed", "uuid-1", -1, DiskList{
        {"vdb", "/images/vm1-vdb.raw", "raw"}
    }, false);
    group.addDomain(renamed);

    ASSERT_EQ(group.getJobs().size(), 1u);
    EXPECT_EQ(group.getJobs()[0]->getDevNames(), (std::vector<std::string>{"vda", "vdb"}));
}

TEST_F(JobGroupTest, AddDomainWithoutDisksSelectsAll) {
    JobGroup group("test", provider_);
    auto job = group.addDomain(domain(2));
    EXPECT_EQ(job->getDevNames(), (std::vector<std::string>{"vda", "vdb"}));

    group.addDomain(domain(2), std::vector<std::string>{"vda"});
    EXPECT_EQ(job->getDisks().size(), 2u);
}

TEST_F(JobGroupTest, AddDomainAppliesGroupDefaults) {
    BackupPolicy policy;
    policy.targetDir = "/srv/backups";
    policy.compression = CompressionMode::GZ;
    JobGroup group("test", provider_, policy);

    auto job = group.addDomain(domain(1));
    EXPECT_EQ(job->getTargetDir(), std::optional<std::string>("/srv/backups/vm1"));
    EXPECT_EQ(job->getCompression(), CompressionMode::GZ);
}

TEST_F(JobGroupTest, DefaultTargetGetsOneDirectoryPerDomain) {
    fs::create_directories(path("images"));
    for (int i = 1; i <= 2; ++i) {
        writeFile(path("images/vm" + std::to_string(i) + ".qcow2"), "disk of vm" + std::to_string(i));
    }
    BackupPolicy policy;
    policy.targetDir = path("backups");
    JobGroup group("test", provider_, policy);
    for (int i = 1; i <= 2; ++i) {
        std::string name = "vm" + std::to_string(i);
        group.addDomain(std::make_shared<FakeDomain>(name, "uuid-" + std::to_string(i), i, DiskList{
            {"vda", path("images/" + name + ".qcow2"), "qcow2"}
        }));
    }

    BackupPolicy explicitTarget;
    explicitTarget.targetDir = path("elsewhere");
    auto pinned = std::make_shared<BackupJob>(
        std::make_shared<FakeDomain>("vm3", "uuid-3", 3, DiskList{{"vda", path("images/vm1.qcow2"), "qcow2"}}),
        provider_, std::vector<std::string>{}, explicitTarget);
    group.addJob(pinned);

    group.start();

    auto date = provider_->state().date;
    for (int i = 1; i <= 2; ++i) {
        std::string name = "vm" + std::to_string(i);
        fs::path dir = fs::path(path("backups")) / name;
        EXPECT_TRUE(fs::exists(dir / (formatBackupName(date, i, name) + ".json"))) << name;
        EXPECT_TRUE(fs::exists(dir / (formatBackupName(date, i, name) + ".tar"))) << name;
    }
    EXPECT_TRUE(fs::exists(fs::path(path("elsewhere")) / (formatBackupName(date, 3, "vm3") + ".json")));
    EXPECT_FALSE(fs::exists(fs::path(path("backups")) / "vm3"));
}

TEST_F(JobGroupTest, AddJobKeepsExistingPolicyOnConflict) {
    JobGroup group("test", provider_);

    BackupPolicy first;
    first.targetDir = "/srv/a";
    auto existing = std::make_shared<BackupJob>(domain(1), provider_, std::vector<std::string>{"vda"}, first);
    EXPECT_EQ(group.addJob(existing), existing);

    BackupPolicy second;
    second.targetDir = "/srv/b";
    auto conflicting = std::make_shared<BackupJob>(domain(1), provider_, std::vector<std::string>{"vdb"}, second);
    EXPECT_EQ(group.addJob(conflicting), existing);

    ASSERT_EQ(group.getJobs().size(), 1u);
    EXPECT_EQ(existing->getTargetDir(), std::optional<std::string>("/srv/a"));
    EXPECT_EQ(existing->getDevNames(), (std::vector<std::string>{"vda", "vdb"}));
}

TEST_F(JobGroupTest, SearchAndGetJob) {
    JobGroup group("test", provider_);
    auto job = group.addDomain(domain(1));

    auto found = group.search(*domain(1));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], job);
    EXPECT_EQ(group.getJob(*domain(1)), job);

    EXPECT_TRUE(group.search(*domain(2)).empty());
    EXPECT_THROW(group.getJob(*domain(2)), JobNotFoundError);
}

TEST_F(JobGroupTest, PropagateDefaultPolicyKeepsOverrides) {
    JobGroup group("test", provider_);
    auto job = group.addDomain(domain(1));
    job->setCompression(CompressionMode::XZ);

    BackupPolicy policy;
    policy.targetDir = "/srv/new";
    policy.compression = CompressionMode::GZ;
    group.setDefaultPolicy(policy);
    EXPECT_FALSE(job->getTargetDir().has_value());

    group.propagateDefaultPolicy();
    EXPECT_EQ(job->getTargetDir(), std::optional<std::string>("/srv/new/vm1"));
    EXPECT_EQ(job->getCompression(), CompressionMode::XZ);
    EXPECT_EQ(group.getDefaultPolicy().targetDir, std::optional<std::string>("/srv/new"));
}

TEST_F(JobGroupTest, StartRunsEveryJobAndAggregatesFailures) {
    JobGroup group("test", provider_);
    auto ok1 = std::make_shared<StubJob>(domain(1), provider_, false);
    auto failing = std::make_shared<StubJob>(domain(2), provider_, true);
    auto ok2 = std::make_shared<StubJob>(domain(3), provider_, false);
    group.addJob(ok1);
    group.addJob(failing);
    group.addJob(ok2);

    try {
        group.start();
        FAIL() << "expected GroupBackupFailureError";
    } catch (const GroupBackupFailureError& e) {
        ASSERT_EQ(e.failures().size(), 1u);
        EXPECT_EQ(e.failures()[0].job, failing);
        EXPECT_THROW(std::rethrow_exception(e.failures()[0].error), SnapshotError);
        EXPECT_NE(std::string(e.what()).find("vm2"), std::string::npos);
    }

    EXPECT_EQ(ok1->calls.load(), 1);
    EXPECT_EQ(failing->calls.load(), 1);
    EXPECT_EQ(ok2->calls.load(), 1);
}

TEST_F(JobGroupTest, StartWithoutFailuresDoesNotThrow) {
    JobGroup group("test", provider_);
    auto job = std::make_shared<StubJob>(domain(1), provider_, false);
    group.addJob(job);

    EXPECT_NO_THROW(group.start());
    EXPECT_EQ(job->calls.load(), 1);
}

TEST_F(JobGroupTest, StartConcurrentBoundsWorkers) {
    JobGroup group("test", provider_);
    auto tracker = std::make_shared<ConcurrencyTracker>();
    std::vector<std::shared_ptr<StubJob>> jobs;
    for (int i = 1; i <= 6; ++i) {
        jobs.push_back(std::make_shared<StubJob>(domain(i), provider_, false, tracker));
        group.addJob(jobs.back());
    }

    EXPECT_NO_THROW(group.startConcurrent(2));

    for (const auto& job : jobs) {
        EXPECT_EQ(job->calls.load(), 1);
    }
    EXPECT_GE(tracker->peak.load(), 1);
    EXPECT_LE(tracker->peak.load(), 2);
}

TEST_F(JobGroupTest, StartConcurrentAggregatesFailures) {
    JobGroup group("test", provider_);
    std::vector<std::shared_ptr<StubJob>> jobs;
    for (int i = 1; i <= 4; ++i) {
        jobs.push_back(std::make_shared<StubJob>(domain(i), provider_, i % 2 == 0));
        group.addJob(jobs.back());
    }

    try {
        group.startConcurrent(3);
        FAIL() << "expected GroupBackupFailureError";
    } catch (const GroupBackupFailureError& e) {
        std::set<std::string> failed;
        for (const auto& failure : e.failures()) {
            failed.insert(failure.job->getDomainName());
        }
        EXPECT_EQ(failed, (std::set<std::string>{"vm2", "vm4"}));
    }

    for (const auto& job : jobs) {
        EXPECT_EQ(job->calls.load(), 1);
    }
}

// One real job fails while extracting vdb, the other only has vda.
class JobGroupArtifactsTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        provider_ = std::make_shared<FakeSnapshotProvider>();
        provider_->state().failCleanForDisk = "vdb";
        fs::create_directories(path("images"));
        writeFile(path("images/good-vda.qcow2"), "good disk");
        writeFile(path("images/bad-vda.qcow2"), "bad disk");
        writeFile(path("images/bad-vdb.raw"), "bad second disk");

        good_ = std::make_shared<FakeDomain>("good", "uuid-good", 1, DiskList{
            {"vda", path("images/good-vda.qcow2"), "qcow2"}
        });
        bad_ = std::make_shared<FakeDomain>("bad", "uuid-bad", 2, DiskList{
            {"vda", path("images/bad-vda.qcow2"), "qcow2"},
            {"vdb", path("images/bad-vdb.raw"), "raw"}
        });

        BackupPolicy policy;
        policy.targetDir = path("backups");
        group_ = std::make_unique<JobGroup>("test", provider_, policy);
        group_->addDomain(bad_);
        group_->addDomain(good_);
    }

    fs::path backupOf(const std::string& name, int id, const std::string& extension) const {
        return fs::path(path("backups")) / name /
               (formatBackupName(provider_->state().date, id, name) + extension);
    }

    void expectOnlyGoodBackupSurvives(const GroupBackupFailureError& e) const {
        ASSERT_EQ(e.failures().size(), 1u);
        EXPECT_EQ(e.failures()[0].job->getDomainName(), "bad");

        EXPECT_TRUE(fs::exists(backupOf("good", 1, ".json")));
        EXPECT_TRUE(fs::exists(backupOf("good", 1, ".tar")));
        EXPECT_FALSE(fs::exists(backupOf("bad", 2, ".json")));
        EXPECT_FALSE(fs::exists(backupOf("bad", 2, ".tar")));
        EXPECT_FALSE(fs::exists(backupOf("bad", 2, ".json.pending")));
    }

    std::shared_ptr<FakeSnapshotProvider> provider_;
    std::shared_ptr<FakeDomain> good_;
    std::shared_ptr<FakeDomain> bad_;
    std::unique_ptr<JobGroup> group_;
};

TEST_F(JobGroupArtifactsTest, SequentialFailureKeepsOtherBackups) {
    try {
        group_->start();
        FAIL() << "expected GroupBackupFailureError";
    } catch (const GroupBackupFailureError& e) {
        expectOnlyGoodBackupSurvives(e);
    }
}

TEST_F(JobGroupArtifactsTest, ConcurrentFailureKeepsOtherBackups) {
    try {
        group_->startConcurrent(2);
        FAIL() << "expected GroupBackupFailureError";
    } catch (const GroupBackupFailureError& e) {
        expectOnlyGoodBackupSurvives(e);
    }
}

TEST_F(JobGroupTest, EmptyGroupStarts) {
    JobGroup group("empty", provider_);
    EXPECT_NO_THROW(group.start());
    EXPECT_NO_THROW(group.startConcurrent(4));
}

TEST_F(JobGroupTest, CleanAbortedOnlyTouchesGroupDomains) {
    BackupPolicy policy;
    policy.targetDir = tempDir_.string();
    JobGroup group("test", provider_, policy);
    group.addDomain(domain(1));

    fs::create_directories(path("vm1"));
    auto date = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    std::vector<std::string> ledgers;
    for (int i = 1; i <= 2; ++i) {
        PendingLedger ledger;
        ledger.domainName = domain(i)->getName();
        ledger.domainId = i;
        ledger.date = date;
        ledger.disks["vda"] = PendingDisk{"/images/vda.qcow2", "/images/vda.qcow2.overlay", std::nullopt};
        ledgers.push_back(path("vm1/" + formatBackupName(date, i, ledger.domainName) + PENDING_LEDGER_SUFFIX));
        ledger.save(ledgers.back());
    }

    EXPECT_EQ(group.cleanAborted(conn_), 1u);
    EXPECT_FALSE(fs::exists(ledgers[0]));
    EXPECT_TRUE(fs::exists(ledgers[1]));
}
