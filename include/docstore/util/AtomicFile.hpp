#pragma once
/// @file AtomicFile.hpp
/// @brief Crash-safe whole-file replacement and plain file reads

#include <string>
#include <system_error>

namespace DocStore::util {

/// @brief Replace `path` with `content` atomically
/// @details Writes `<path>.tmp` in the same directory, fsyncs it, renames it
///          over `path` and then fsyncs the directory entry where the
///          filesystem supports it. On failure the temporary file is removed
///          and the previous content of `path` is untouched.
/// @param path Target file path
/// @param content Bytes to store
/// @param ec Error code (errno on failure)
/// @return true on success
bool writeFileAtomic(const std::string& path, const std::string& content, std::error_code& ec);

/// @brief Read a whole file
/// @param path File path
/// @param out File contents
/// @param ec Error code (errno, including ENOENT for a missing file)
/// @return true on success
bool readFile(const std::string& path, std::string& out, std::error_code& ec);

/// @brief fsync a directory so a completed rename survives a crash
/// @details EINVAL/ENOTSUP from filesystems without directory sync are not errors.
bool syncDirectory(const std::string& dir, std::error_code& ec);

} // namespace DocStore::util
