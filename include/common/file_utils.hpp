#pragma once

#include <string>

namespace file_utils {

// Copies src to dst, replacing dst. If dst is an existing directory the file
// keeps its name inside it. Returns the destination path. Throws
// std::filesystem::filesystem_error.
std::string copyFile(const std::string& src, const std::string& dst);

// Writes content to path.tmp, syncs it, then renames it over path.
void writeFileAtomically(const std::string& path, const std::string& content);

// Removes path if it exists. Failures are logged and reported by the
// return value, never thrown.
bool removeWithErrorLogging(const std::string& path);

std::string joinPath(const std::string& dir, const std::string& name);

} // namespace file_utils
