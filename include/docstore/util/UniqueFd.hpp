#pragma once
/// @file UniqueFd.hpp
/// @brief Owning handle for the descriptors behind collection, temp and lock files

#include <cerrno>
#include <fcntl.h>
#include <string>
#include <sys/types.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace DocStore {
namespace detail {

/// @brief Move-only owner of one POSIX file descriptor
///
/// Every descriptor the store opens goes through open() so it is
/// close-on-exec and EINTR-safe. The destructor and discard() close without
/// reporting; write paths call close(ec) so deferred I/O errors are seen.
///
/// @note Internal to the library.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { discard(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        UniqueFd(std::move(other)).swap(*this);
        return *this;
    }

    void swap(UniqueFd& other) noexcept { std::swap(fd_, other.fd_); }

    /// @brief open(2) with O_CLOEXEC, retried on EINTR
    /// @param mode Permission bits used when O_CREAT is set
    /// @param ec errno on failure
    /// @return Owning handle, invalid on failure
    static UniqueFd open(const std::string& path, int flags, mode_t mode, std::error_code& ec) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        int fd;
        do {
            fd = ::open(path.c_str(), flags, mode);
        } while (fd < 0 && errno == EINTR);
        if (fd < 0)
            ec = std::error_code(errno, std::generic_category());
        return UniqueFd(fd);
    }

    /// @brief Read-only handle on a directory, used to fsync renames into it
    static UniqueFd openDirectory(const std::string& dir, std::error_code& ec) {
        int flags = O_RDONLY;
#ifdef O_DIRECTORY
        flags |= O_DIRECTORY;
#endif
        return open(dir, flags, 0, ec);
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /// @brief fsync(2) the descriptor
    /// @param ec errno on failure, EBADF when the handle is empty
    bool sync(std::error_code& ec) const noexcept {
        ec.clear();
        if (fd_ < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return false;
        }
        if (::fsync(fd_) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

    /// @brief Close and forget the descriptor, ignoring close(2) failures
    /// @details For error paths that already carry the error being reported.
    void discard() noexcept {
        if (fd_ >= 0)
            ::close(std::exchange(fd_, -1));
    }

    /// @brief Close and report close(2) failures
    /// @return true when closed cleanly or already empty
    bool close(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        // close 는 실패해도 fd 를 해제하므로 재시도하지 않는다.
        if (::close(std::exchange(fd_, -1)) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace DocStore
