#pragma once

#include "common/compression.hpp"
#include <memory>
#include <optional>
#include <string>

struct archive;

// Streaming writer for a (possibly compressed) GNU tar archive, backed by
// libarchive. Members are appended one after another; close() writes the
// end-of-archive marker and flushes the compressor. Destroying an archive
// that was not closed discards it half-written, which is what the abort path
// expects.
class TarArchive {
public:
    // Creates path exclusively. Throws ArchiveExistsError if it already
    // exists. level is the gzip/bzip2 level or the xz preset; unset picks
    // 9 for gzip/bzip2 and 6 for xz.
    static std::unique_ptr<TarArchive> create(const std::string& path,
                                              CompressionMode mode,
                                              std::optional<int> level = std::nullopt);
    ~TarArchive();

    TarArchive(const TarArchive&) = delete;
    TarArchive& operator=(const TarArchive&) = delete;

    void addFile(const std::string& sourcePath, const std::string& arcname);
    void close();

    bool isClosed() const { return closed_; }

private:
    TarArchive(std::string path, int fd, struct archive* writer);

    void configure(CompressionMode mode, std::optional<int> level);
    std::string archiveError(const std::string& what) const;

    std::string path_;
    int fd_;
    struct archive* writer_;
    bool closed_{false};
};
