#include <gtest/gtest.h>
#include "backup/backup_definition.hpp"
#include "common/compression.hpp"
#include "common/errors.hpp"
#include "test_fakes.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class BackupDefinitionTest : public TempDirTest {
};

TEST_F(BackupDefinitionTest, DefinitionUsesOnDiskKeys) {
    BackupDefinition definition;
    definition.compression = CompressionMode::XZ;
    definition.compressionLevel = 6;
    definition.domainId = 3;
    definition.domainName = "db";
    definition.domainXml = "<domain/>";
    definition.version = "1.0.0";
    definition.date = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    definition.disks["vda"] = "x_vda.qcow2";
    definition.archiveFilename = "x.tar.xz";

    json out = definition.toJson();
    EXPECT_EQ(out["compression"], "xz");
    EXPECT_EQ(out["compression_lvl"], 6);
    EXPECT_EQ(out["domain_id"], 3);
    EXPECT_EQ(out["domain_name"], "db");
    EXPECT_EQ(out["domain_xml"], "<domain/>");
    EXPECT_EQ(out["version"], "1.0.0");
    EXPECT_EQ(out["date"], 1700000000);
    EXPECT_EQ(out["disks"]["vda"], "x_vda.qcow2");
    EXPECT_EQ(out["tar"], "x.tar.xz");
}

TEST_F(BackupDefinitionTest, PlainCopiesHaveNullCompressionAndNoTar) {
    BackupDefinition definition;
    definition.compression = CompressionMode::NONE;
    definition.domainName = "db";

    json out = definition.toJson();
    EXPECT_TRUE(out["compression"].is_null());
    EXPECT_TRUE(out["compression_lvl"].is_null());
    EXPECT_FALSE(out.contains("tar"));
    EXPECT_FALSE(out.contains("date"));

    BackupDefinition parsed = BackupDefinition::fromJson(out);
    EXPECT_EQ(parsed.compression, CompressionMode::NONE);
    EXPECT_FALSE(parsed.archiveFilename.has_value());
}

TEST_F(BackupDefinitionTest, LedgerRecordsTargetsOnlyOnceChosen) {
    PendingLedger ledger;
    ledger.domainName = "db";
    ledger.disks["vda"] = PendingDisk{"/img/vda.qcow2", "/img/vda.snap", std::string("x_vda.qcow2")};
    ledger.disks["vdb"] = PendingDisk{"/img/vdb.raw", "/img/vdb.snap", std::nullopt};
    EXPECT_TRUE(ledger.hasSnapshots());

    json out = ledger.toJson();
    EXPECT_EQ(out["disks"]["vda"]["src"], "/img/vda.qcow2");
    EXPECT_EQ(out["disks"]["vda"]["snapshot"], "/img/vda.snap");
    EXPECT_EQ(out["disks"]["vda"]["target"], "x_vda.qcow2");
    EXPECT_FALSE(out["disks"]["vdb"].contains("target"));

    ledger.save(path("x.json.pending"));
    PendingLedger loaded = PendingLedger::load(path("x.json.pending"));
    EXPECT_EQ(loaded.disks.at("vda").target, std::optional<std::string>("x_vda.qcow2"));
    EXPECT_FALSE(loaded.disks.at("vdb").target.has_value());
    EXPECT_EQ(listFiles(), (std::vector<std::string>{"x.json.pending"}));
}

TEST_F(BackupDefinitionTest, LoadRejectsGarbage) {
    writeFile(path("bad.json.pending"), "not json");
    EXPECT_THROW(PendingLedger::load(path("bad.json.pending")), ConfigError);
    EXPECT_THROW(PendingLedger::load(path("missing.json.pending")), ConfigError);

    writeFile(path("nameless.json.pending"), R"({"disks": {}})");
    EXPECT_THROW(PendingLedger::load(path("nameless.json.pending")), ConfigError);
}

TEST_F(BackupDefinitionTest, BackupNamesFollowTheLayout) {
    auto date = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    std::string name = formatBackupName(date, 12, "web");
    ASSERT_EQ(name.size(), std::string("YYYYMMDD-HHMMSS_12_web").size());
    EXPECT_EQ(name[8], '-');
    EXPECT_EQ(name.substr(15), "_12_web");
    EXPECT_EQ(formatDiskBackupName(date, 12, "web", "vda"), name + "_vda");
}

TEST(CompressionTest, ConfigSpellings) {
    EXPECT_EQ(compressionFromJson(json(nullptr)), CompressionMode::NONE);
    EXPECT_EQ(compressionFromJson(json("none")), CompressionMode::NONE);
    EXPECT_EQ(compressionFromJson(json("tar")), CompressionMode::STORE);
    EXPECT_EQ(compressionFromJson(json("store")), CompressionMode::STORE);
    EXPECT_EQ(compressionFromJson(json("gz")), CompressionMode::GZ);
    EXPECT_EQ(compressionFromJson(json("bz2")), CompressionMode::BZ2);
    EXPECT_EQ(compressionFromJson(json("xz")), CompressionMode::XZ);
    EXPECT_THROW(compressionFromJson(json("zip")), ConfigError);
    EXPECT_THROW(compressionFromJson(json(3)), ConfigError);

    EXPECT_EQ(archiveExtension(CompressionMode::STORE), "tar");
    EXPECT_EQ(archiveExtension(CompressionMode::BZ2), "tar.bz2");
    EXPECT_TRUE(compressionToJson(CompressionMode::NONE).is_null());
    EXPECT_EQ(compressionToJson(CompressionMode::STORE), "tar");
}
