#include "common/file_utils.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <unistd.h>

namespace fs = std::filesystem;

namespace file_utils {

std::string copyFile(const std::string& src, const std::string& dst) {
    fs::path target(dst);
    if (fs::is_directory(target)) {
        target /= fs::path(src).filename();
    } else if (target.has_parent_path() && !fs::exists(target.parent_path())) {
        fs::create_directories(target.parent_path());
    }

    fs::copy_file(src, target, fs::copy_options::overwrite_existing);
    return target.string();
}

void writeFileAtomically(const std::string& path, const std::string& content) {
    const std::string tmpPath = path + ".tmp";

    FILE* file = fopen(tmpPath.c_str(), "w");
    if (!file) {
        throw fs::filesystem_error("Failed to open " + tmpPath, tmpPath,
                                   std::error_code(errno, std::generic_category()));
    }

    bool written = fwrite(content.data(), 1, content.size(), file) == content.size();
    written = fflush(file) == 0 && written;
    written = fsync(fileno(file)) == 0 && written;
    int savedErrno = errno;
    if (fclose(file) != 0) {
        written = false;
        savedErrno = errno;
    }

    if (!written) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw fs::filesystem_error("Failed to write " + tmpPath, tmpPath,
                                   std::error_code(savedErrno, std::generic_category()));
    }

    fs::rename(tmpPath, path);
}

bool removeWithErrorLogging(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return true;
    }

    fs::remove(path, ec);
    if (ec) {
        Logger::error("Failed to remove " + path + ": " + ec.message());
        return false;
    }
    Logger::debug("Removed " + path);
    return true;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    return (fs::path(dir) / name).string();
}

} // namespace file_utils
