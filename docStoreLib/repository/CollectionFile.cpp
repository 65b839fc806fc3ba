#include <docstore/repository/CollectionFile.hpp>
#include <docstore/util/AtomicFile.hpp>
#include <docstore/util/JsonIo.hpp>
#include <docstore/util/StoreError.hpp>
#include <docstore/util/textUtil.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <filesystem>
#include <sys/stat.h>

namespace DocStore {

namespace fs = std::filesystem;

CollectionFile::CollectionFile(std::string path, std::string lockDir)
    : path_(std::move(path)), lockDir_(std::move(lockDir)),
      lockPath_(lockPathFor(path_, lockDir_)) {}

std::string CollectionFile::lockPathFor(const std::string& path, const std::string& lockDir) {
    // 같은 파일을 가리키는 모든 저장소 인스턴스(다른 프로세스 포함)가
    // 같은 lock 파일을 쓰도록 정규화된 절대 경로로 해시한다.
    std::error_code ec;
    fs::path abs = fs::weakly_canonical(fs::path(path), ec);
    if (ec) {
        ec.clear();
        abs = fs::absolute(fs::path(path), ec).lexically_normal();
        if (ec)
            abs = fs::path(path).lexically_normal();
    }
    const std::string name = fs::path(path).filename().string();
    return (fs::path(lockDir) / (name + "_" + util::toHex(util::fnv1a64(abs.string())) + ".lock"))
        .string();
}

detail::FileLockGuard CollectionFile::lock(std::chrono::milliseconds timeout, std::error_code& ec) const {
    ec.clear();
    std::error_code dirEc;
    fs::create_directories(lockDir_, dirEc);
    if (dirEc) {
        ec = dirEc;
        spdlog::error("cannot create lock directory {}: {}", lockDir_, ec.message());
        return detail::FileLockGuard();
    }

    detail::FileLockGuard guard(lockPath_, timeout, ec);
    if (ec) {
        if (ec == StoreErrc::LockTimeout)
            spdlog::warn("lock timeout after {} ms on {}", timeout.count(), path_);
        else
            spdlog::error("cannot lock {}: {}", path_, ec.message());
        return detail::FileLockGuard();
    }
    spdlog::debug("locked {}", lockPath_);
    return guard;
}

bool CollectionFile::stat(FileStamp& out, std::error_code& ec) const {
    ec.clear();
    out = FileStamp{};
    struct stat st{};
    if (::stat(path_.c_str(), &st) < 0) {
        if (errno == ENOENT)
            return true;
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    out.exists = true;
    out.mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    out.size = static_cast<uint64_t>(st.st_size);
    out.inode = static_cast<uint64_t>(st.st_ino);
    return true;
}

bool CollectionFile::read(Json::Value& records, std::error_code& ec) const {
    ec.clear();
    records = Json::Value(Json::arrayValue);

    std::string text;
    if (!util::readFile(path_, text, ec)) {
        if (ec == std::errc::no_such_file_or_directory) {
            ec.clear();
            return true;
        }
        spdlog::error("cannot read {}: {}", path_, ec.message());
        return false;
    }
    if (util::trim(text).empty())
        return true;

    std::string errors;
    Json::Value parsed;
    if (!util::parseJsonText(text, parsed, errors)) {
        spdlog::error("corrupt collection {}: {}", path_, errors);
        ec = StoreErrc::CorruptCollection;
        return false;
    }
    if (!parsed.isArray()) {
        spdlog::error("corrupt collection {}: top level is not an array", path_);
        ec = StoreErrc::CorruptCollection;
        return false;
    }
    for (const auto& rec : parsed) {
        if (!rec.isObject()) {
            spdlog::error("corrupt collection {}: element is not an object", path_);
            ec = StoreErrc::CorruptCollection;
            return false;
        }
    }
    records = std::move(parsed);
    return true;
}

bool CollectionFile::write(const Json::Value& records, std::error_code& ec) const {
    ec.clear();
    fs::path dir = fs::path(path_).parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            spdlog::error("cannot create directory {}: {}", dir.string(), ec.message());
            return false;
        }
    }
    return util::writeJsonFileAtomic(path_, records, ec);
}

bool CollectionFile::loadLocked(Json::Value& records, std::chrono::milliseconds timeout,
                                std::error_code& ec) const {
    auto guard = lock(timeout, ec);
    if (ec)
        return false;
    return read(records, ec);
}

bool CollectionFile::storeLocked(const Json::Value& records, std::chrono::milliseconds timeout,
                                 std::error_code& ec) const {
    auto guard = lock(timeout, ec);
    if (ec)
        return false;
    return write(records, ec);
}

} // namespace DocStore
