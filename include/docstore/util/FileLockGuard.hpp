#pragma once
/// @file FileLockGuard.hpp
/// @brief RAII guard for an exclusive, cross-process lock file with bounded wait

#include "StoreError.hpp"
#include "UniqueFd.hpp"

#include <sys/file.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <string>
#include <system_error>
#include <thread>

namespace DocStore {
namespace detail {

/// @brief RAII guard for flock(2) based exclusive locking of a lock file
///
/// Every acquisition opens its own descriptor on the lock file, so the lock
/// excludes other threads of the same process as well as other processes.
/// The lock file itself is never removed.
///
/// @note This class is for internal library use.
/// @note Waits at most the given timeout, then fails with StoreErrc::LockTimeout.
class FileLockGuard {
  public:
    /// @brief Default constructor. Creates without acquiring lock
    FileLockGuard() = default;

    /// @brief Constructor that acquires the lock
    /// @param lockPath Lock file path (created if missing)
    /// @param timeout Maximum time to wait for the lock
    /// @param ec Error code (set on failure)
    FileLockGuard(const std::string& lockPath, std::chrono::milliseconds timeout,
                  std::error_code& ec) {
        lock(lockPath, timeout, ec);
    }

    /// @brief Destructor. Releases lock if held
    ~FileLockGuard() { unlockIgnore(); }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    FileLockGuard(FileLockGuard&& other) noexcept
        : fd_(std::move(other.fd_)), locked_(other.locked_) {
        other.locked_ = false;
    }

    FileLockGuard& operator=(FileLockGuard&& other) noexcept {
        if (this != &other) {
            unlockIgnore();
            fd_ = std::move(other.fd_);
            locked_ = other.locked_;
            other.locked_ = false;
        }
        return *this;
    }

    /// @brief Acquire the exclusive lock
    /// @param lockPath Lock file path (created if missing)
    /// @param timeout Maximum time to wait for the lock
    /// @param ec Error code (StoreErrc::LockTimeout on expiry, errno otherwise)
    /// @return true on success
    /// @note Releases existing lock first if held
    bool lock(const std::string& lockPath, std::chrono::milliseconds timeout,
              std::error_code& ec) {
        ec.clear();
        unlockIgnore();

        fd_ = UniqueFd::open(lockPath, O_CREAT | O_RDWR, 0666, ec);
        if (ec)
            return false;

        // 논블로킹 시도를 반복하다가 deadline을 넘기면 LockTimeout으로 실패한다.
        // 대기 간격은 1ms에서 시작해 50ms까지 두 배씩 늘린다.
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::chrono::milliseconds backoff(1);
        for (;;) {
            if (::flock(fd_.get(), LOCK_EX | LOCK_NB) == 0) {
                locked_ = true;
                return true;
            }
            if (errno == EINTR)
                continue;
            if (errno != EWOULDBLOCK) {
                ec = std::error_code(errno, std::generic_category());
                fd_.discard();
                return false;
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                ec = StoreErrc::LockTimeout;
                fd_.discard();
                return false;
            }
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(backoff, remaining + std::chrono::milliseconds(1)));
            backoff = std::min(backoff * 2, std::chrono::milliseconds(50));
        }
    }

    /// @brief Release lock (ignores errors)
    void unlockIgnore() noexcept {
        if (locked_ && fd_) {
            // 소멸자에서도 호출되므로 unlock 실패를 상위로 전파하지 않는다.
            ::flock(fd_.get(), LOCK_UN);
        }
        locked_ = false;
        fd_.discard();
    }

    /// @brief Check current lock status
    bool locked() const noexcept { return locked_; }

  private:
    UniqueFd fd_;
    bool locked_ = false;
};

} // namespace detail
} // namespace DocStore
