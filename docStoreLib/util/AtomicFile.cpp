#include <docstore/util/AtomicFile.hpp>
#include <docstore/util/UniqueFd.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace DocStore::util {

namespace fs = std::filesystem;

namespace {

bool writeAll(int fd, const std::string& content, std::error_code& ec) {
    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

bool writeFileAtomic(const std::string& path, const std::string& content, std::error_code& ec) {
    ec.clear();
    const std::string tmpPath = path + ".tmp";

    // 임시 파일 기록 -> fsync -> rename 순서를 지켜야 부분 기록된 파일이 노출되지 않는다.
    // 실패 시 임시 파일만 지우고 원본은 건드리지 않는다.
    auto discard = [&tmpPath]() { ::unlink(tmpPath.c_str()); };

    detail::UniqueFd fd = detail::UniqueFd::open(tmpPath, O_CREAT | O_WRONLY | O_TRUNC, 0644, ec);
    if (ec) {
        spdlog::error("atomic write: cannot open {}: {}", tmpPath, ec.message());
        return false;
    }

    if (!writeAll(fd.get(), content, ec)) {
        spdlog::error("atomic write: write to {} failed: {}", tmpPath, ec.message());
        fd.discard();
        discard();
        return false;
    }

    if (!fd.sync(ec)) {
        spdlog::error("atomic write: fsync {} failed: {}", tmpPath, ec.message());
        fd.discard();
        discard();
        return false;
    }

    if (!fd.close(ec)) {
        spdlog::error("atomic write: close {} failed: {}", tmpPath, ec.message());
        discard();
        return false;
    }

    if (::rename(tmpPath.c_str(), path.c_str()) < 0) {
        ec = std::error_code(errno, std::generic_category());
        spdlog::error("atomic write: rename {} -> {} failed: {}", tmpPath, path, ec.message());
        discard();
        return false;
    }

    fs::path dir = fs::path(path).parent_path();
    if (dir.empty())
        dir = ".";
    std::error_code dirEc;
    if (!syncDirectory(dir.string(), dirEc)) {
        // rename은 이미 완료되었으므로 디렉터리 fsync 실패는 경고로만 남긴다.
        spdlog::warn("atomic write: directory sync of {} failed: {}", dir.string(),
                     dirEc.message());
    }
    return true;
}

bool readFile(const std::string& path, std::string& out, std::error_code& ec) {
    ec.clear();
    out.clear();
    detail::UniqueFd fd = detail::UniqueFd::open(path, O_RDONLY, 0, ec);
    if (ec)
        return false;

    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        if (n == 0)
            break;
        out.append(buf, static_cast<size_t>(n));
    }
    return true;
}

bool syncDirectory(const std::string& dir, std::error_code& ec) {
    detail::UniqueFd fd = detail::UniqueFd::openDirectory(dir, ec);
    if (ec)
        return false;
    if (!fd.sync(ec)) {
        // 디렉터리 fsync 를 지원하지 않는 파일시스템은 성공으로 본다.
        if (ec == std::errc::invalid_argument || ec == std::errc::not_supported) {
            ec.clear();
            return true;
        }
        return false;
    }
    return true;
}

} // namespace DocStore::util
