#pragma once
/// @file CollectionFile.hpp
/// @brief One collection file on disk plus its cross-process lock file

#include "../util/FileLockGuard.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>

namespace DocStore {

/// @brief Identity of a collection file's content as seen by stat(2)
/// @details Atomic replacement changes the inode, so a rewrite inside the
///          same mtime tick is still detected.
struct FileStamp {
    bool exists = false;
    int64_t mtimeNs = 0;
    uint64_t size = 0;
    uint64_t inode = 0;

    bool operator==(const FileStamp& o) const noexcept {
        return exists == o.exists && mtimeNs == o.mtimeNs && size == o.size && inode == o.inode;
    }
    bool operator!=(const FileStamp& o) const noexcept { return !(*this == o); }
};

/// @brief Collection file access: lock, stat, parse and atomic replace
///
/// The file holds a pretty-printed JSON array of record objects. A missing or
/// blank file is an empty collection. read() and write() do not lock; callers
/// hold the guard returned by lock() around them.
class CollectionFile {
  public:
    /// @param path Collection file path
    /// @param lockDir Shared directory for lock files
    CollectionFile(std::string path, std::string lockDir);

    const std::string& path() const noexcept { return path_; }
    const std::string& lockPath() const noexcept { return lockPath_; }

    /// @brief `<lockDir>/<file name>_<hash of absolute path>.lock`
    static std::string lockPathFor(const std::string& path, const std::string& lockDir);

    /// @brief Acquire the collection's exclusive lock
    /// @param ec StoreErrc::LockTimeout on expiry, errno otherwise
    detail::FileLockGuard lock(std::chrono::milliseconds timeout, std::error_code& ec) const;

    /// @brief Current stamp of the file (exists=false when missing, not an error)
    bool stat(FileStamp& out, std::error_code& ec) const;

    /// @brief Parse the collection
    /// @param records JSON array (empty when the file is missing or blank)
    /// @param ec StoreErrc::CorruptCollection when not an array of objects
    bool read(Json::Value& records, std::error_code& ec) const;

    /// @brief Atomically replace the collection, creating its directory if needed
    bool write(const Json::Value& records, std::error_code& ec) const;

    /// @brief lock + read
    bool loadLocked(Json::Value& records, std::chrono::milliseconds timeout, std::error_code& ec) const;

    /// @brief lock + write
    bool storeLocked(const Json::Value& records, std::chrono::milliseconds timeout,
                     std::error_code& ec) const;

  private:
    std::string path_;
    std::string lockDir_;
    std::string lockPath_;
};

} // namespace DocStore
