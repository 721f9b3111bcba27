#include "common/tar_archive.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

constexpr size_t COPY_BUFFER_SIZE = 1024 * 1024;

int defaultLevel(CompressionMode mode) {
    return mode == CompressionMode::XZ ? 6 : 9;
}

// Owns the source descriptor while its bytes are streamed into the archive.
class SourceFile {
public:
    explicit SourceFile(const std::string& path) : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
        if (fd_ < 0) {
            throw std::runtime_error("Failed to open " + path + ": " + strerror(errno));
        }
    }
    ~SourceFile() { ::close(fd_); }

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

} // namespace

std::unique_ptr<TarArchive> TarArchive::create(const std::string& path,
                                               CompressionMode mode,
                                               std::optional<int> level) {
    if (!isArchiving(mode)) {
        throw std::invalid_argument("compression mode " + compressionToString(mode) + " is not an archive");
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            throw ArchiveExistsError(path);
        }
        throw std::runtime_error("Failed to create archive " + path + ": " + strerror(errno));
    }

    struct archive* writer = archive_write_new();
    if (!writer) {
        ::close(fd);
        ::unlink(path.c_str());
        throw std::runtime_error("Failed to allocate archive writer");
    }
    // tar owns fd and writer from here on
    std::unique_ptr<TarArchive> tar(new TarArchive(path, fd, writer));
    try {
        tar->configure(mode, level);
    } catch (...) {
        tar.reset();
        ::unlink(path.c_str());
        throw;
    }

    Logger::debug("Created archive " + path + " (" + compressionToString(mode) + ")");
    return tar;
}

void TarArchive::configure(CompressionMode mode, std::optional<int> level) {
    // GNU format keeps member names and sizes unbounded
    if (archive_write_set_format_gnutar(writer_) != ARCHIVE_OK) {
        throw std::runtime_error(archiveError("Failed to select tar format"));
    }

    int status = ARCHIVE_OK;
    switch (mode) {
        case CompressionMode::GZ:  status = archive_write_add_filter_gzip(writer_); break;
        case CompressionMode::BZ2: status = archive_write_add_filter_bzip2(writer_); break;
        case CompressionMode::XZ:  status = archive_write_add_filter_xz(writer_); break;
        default:                   status = archive_write_add_filter_none(writer_); break;
    }
    if (status != ARCHIVE_OK) {
        throw std::runtime_error(archiveError("Failed to set up " + compressionToString(mode) + " filter"));
    }

    if (mode != CompressionMode::STORE) {
        std::string value = std::to_string(level.value_or(defaultLevel(mode)));
        if (archive_write_set_filter_option(writer_, nullptr, "compression-level", value.c_str()) != ARCHIVE_OK) {
            throw ConfigError(archiveError("Invalid compression level " + value));
        }
    }

    if (archive_write_open_fd(writer_, fd_) != ARCHIVE_OK) {
        throw std::runtime_error(archiveError("Failed to open archive " + path_));
    }
}

TarArchive::TarArchive(std::string path, int fd, struct archive* writer)
    : path_(std::move(path))
    , fd_(fd)
    , writer_(writer) {}

TarArchive::~TarArchive() {
    if (writer_) {
        // Mark the stream failed so free() does not write a trailer
        archive_write_fail(writer_);
        archive_write_free(writer_);
    }
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void TarArchive::addFile(const std::string& sourcePath, const std::string& arcname) {
    if (closed_) {
        throw std::logic_error("archive " + path_ + " is already closed");
    }

    SourceFile source(sourcePath);
    struct stat st;
    if (fstat(source.fd(), &st) != 0) {
        throw std::runtime_error("Failed to stat " + sourcePath + ": " + strerror(errno));
    }

    std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(),
                                                                              &archive_entry_free);
    archive_entry_set_pathname(entry.get(), arcname.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), st.st_size);
    archive_entry_set_mtime(entry.get(), st.st_mtime, 0);
    archive_entry_set_uname(entry.get(), "root");
    archive_entry_set_gname(entry.get(), "root");

    if (archive_write_header(writer_, entry.get()) != ARCHIVE_OK) {
        throw std::runtime_error(archiveError("Failed to add " + arcname));
    }

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    int64_t remaining = st.st_size;
    while (remaining > 0) {
        ssize_t n = ::read(source.fd(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Failed to read " + sourcePath + ": " + strerror(errno));
        }
        if (n == 0) {
            throw std::runtime_error(sourcePath + " shrank while being archived");
        }
        size_t chunk = static_cast<size_t>(std::min<int64_t>(n, remaining));
        if (archive_write_data(writer_, buffer.data(), chunk) < 0) {
            throw std::runtime_error(archiveError("Failed to write " + arcname));
        }
        remaining -= static_cast<int64_t>(chunk);
    }

    if (archive_write_finish_entry(writer_) != ARCHIVE_OK) {
        throw std::runtime_error(archiveError("Failed to finish " + arcname));
    }
}

void TarArchive::close() {
    if (closed_) {
        return;
    }
    if (archive_write_close(writer_) != ARCHIVE_OK) {
        throw std::runtime_error(archiveError("Failed to close archive " + path_));
    }
    archive_write_free(writer_);
    writer_ = nullptr;

    int fd = fd_;
    fd_ = -1;
    if (fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("Failed to flush archive " + path_ + ": " + strerror(err));
    }
    if (::close(fd) != 0) {
        throw std::runtime_error("Failed to close archive " + path_ + ": " + strerror(errno));
    }
    closed_ = true;
}

std::string TarArchive::archiveError(const std::string& what) const {
    const char* detail = writer_ ? archive_error_string(writer_) : nullptr;
    return what + ": " + (detail ? detail : "unknown libarchive error");
}
