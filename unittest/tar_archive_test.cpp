#include <gtest/gtest.h>
#include "common/tar_archive.hpp"
#include "common/errors.hpp"
#include "test_fakes.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

class TarArchiveTest : public TempDirTest {
protected:
    // Reads every member back through libarchive's auto-detecting reader.
    static std::map<std::string, std::string> readMembers(const std::string& archivePath) {
        std::map<std::string, std::string> members;
        struct archive* reader = archive_read_new();
        archive_read_support_filter_all(reader);
        archive_read_support_format_all(reader);
        if (archive_read_open_filename(reader, archivePath.c_str(), 10240) != ARCHIVE_OK) {
            ADD_FAILURE() << archive_error_string(reader);
            archive_read_free(reader);
            return members;
        }

        struct archive_entry* entry = nullptr;
        while (archive_read_next_header(reader, &entry) == ARCHIVE_OK) {
            std::string content;
            char buffer[4096];
            la_ssize_t n;
            while ((n = archive_read_data(reader, buffer, sizeof(buffer))) > 0) {
                content.append(buffer, static_cast<size_t>(n));
            }
            members[archive_entry_pathname(entry)] = content;
        }
        archive_read_free(reader);
        return members;
    }
};

TEST_F(TarArchiveTest, StoresMembersUncompressed) {
    writeFile(path("vda.img"), "hello world");
    writeFile(path("vdb.img"), "second disk");
    auto archive = TarArchive::create(path("out.tar"), CompressionMode::STORE);
    archive->addFile(path("vda.img"), "backup_vda.qcow2");
    archive->addFile(path("vdb.img"), "backup_vdb.raw");
    archive->close();
    EXPECT_TRUE(archive->isClosed());

    std::string data = readFile(path("out.tar"));
    ASSERT_EQ(data.size() % 512, 0u);
    EXPECT_EQ(std::string(data.c_str()), "backup_vda.qcow2");

    auto members = readMembers(path("out.tar"));
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members["backup_vda.qcow2"], "hello world");
    EXPECT_EQ(members["backup_vdb.raw"], "second disk");
}

TEST_F(TarArchiveTest, KeepsLongMemberNames) {
    writeFile(path("disk.img"), "data");
    std::string longName = std::string(120, 'n') + ".qcow2";
    auto archive = TarArchive::create(path("out.tar"), CompressionMode::STORE);
    archive->addFile(path("disk.img"), longName);
    archive->close();

    auto members = readMembers(path("out.tar"));
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members.begin()->first, longName);
    EXPECT_EQ(members.begin()->second, "data");
}

TEST_F(TarArchiveTest, RefusesExistingFile) {
    writeFile(path("out.tar"), "keep me");
    EXPECT_THROW(TarArchive::create(path("out.tar"), CompressionMode::STORE), ArchiveExistsError);
    EXPECT_EQ(readFile(path("out.tar")), "keep me");
}

TEST_F(TarArchiveTest, CompressedArchivesRoundTrip) {
    std::string payload(100000, 'z');
    writeFile(path("disk.img"), payload);

    struct Case {
        CompressionMode mode;
        const char* name;
        std::string magic;
    };
    const Case cases[] = {
        {CompressionMode::GZ, "out.tar.gz", std::string("\x1f\x8b", 2)},
        {CompressionMode::BZ2, "out.tar.bz2", "BZh"},
        {CompressionMode::XZ, "out.tar.xz", std::string("\xfd" "7zXZ", 5)},
    };
    for (const auto& c : cases) {
        auto archive = TarArchive::create(path(c.name), c.mode, 1);
        archive->addFile(path("disk.img"), "disk.img");
        archive->close();

        std::string data = readFile(path(c.name));
        EXPECT_EQ(data.substr(0, c.magic.size()), c.magic) << c.name;
        EXPECT_LT(data.size(), payload.size()) << c.name;
        EXPECT_EQ(readMembers(path(c.name))["disk.img"], payload) << c.name;
    }
}

TEST_F(TarArchiveTest, InvalidLevelLeavesNoFile) {
    EXPECT_THROW(TarArchive::create(path("out.tar.gz"), CompressionMode::GZ, 42), ConfigError);
    EXPECT_FALSE(fs::exists(path("out.tar.gz")));
}

TEST_F(TarArchiveTest, UnclosedArchiveIsNotFinalized) {
    writeFile(path("disk.img"), std::string(4096, 'a'));
    {
        auto archive = TarArchive::create(path("out.tar"), CompressionMode::STORE);
        archive->addFile(path("disk.img"), "disk.img");
    }
    EXPECT_TRUE(fs::exists(path("out.tar")));
    EXPECT_LT(readFile(path("out.tar")).size(), 10240u);
}

TEST_F(TarArchiveTest, MissingSourceThrows) {
    auto archive = TarArchive::create(path("out.tar"), CompressionMode::STORE);
    EXPECT_THROW(archive->addFile(path("missing.img"), "missing.img"), std::runtime_error);
}
