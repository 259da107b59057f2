/**
 * @file Unix.hpp
 * @brief Shared utilities for the POSIX backends (Linux, macOS, the BSDs, Haiku).
 *
 * @details Helpers are inline so every backend translation unit can include
 * them without ODR issues. They cover the pieces every POSIX backend repeats:
 * - Owning file descriptors (FdGuard)
 * - EINTR retry and poll-with-timeout
 * - Kernel identity via uname
 * - Mapping stat(2) results onto the portable file model
 */

#pragma once

#if !defined(_WIN32)

  #include <cerrno>      // errno, EINTR
  #include <chrono>      // std::chrono::{seconds, nanoseconds}
  #include <fcntl.h>     // fcntl, F_GETFL, F_SETFL, O_NONBLOCK
  #include <poll.h>      // poll, pollfd
  #include <sys/stat.h>  // struct stat, S_IS*
  #include <sys/utsname.h> // uname, utsname
  #include <unistd.h>    // close
  #include <utility>     // std::exchange

  #include <Conduit++/Files/FileSystem.hpp>
  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Types.hpp>

namespace conduit::os::unix_shared {
  namespace types = ::conduit::utils::types;
  namespace error = ::conduit::utils::error;

  // ─────────────────────────────────────────────────────────────────────────────
  // Descriptors
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief RAII owner of a file descriptor.
   *
   * Closes the descriptor on destruction unless release() handed it on.
   */
  class FdGuard {
    int m_fd = -1;

   public:
    FdGuard() = default;

    explicit FdGuard(const int fd) : m_fd(fd) {}

    ~FdGuard() {
      if (m_fd >= 0)
        ::close(m_fd);
    }

    // Non-copyable
    FdGuard(const FdGuard&)                    = delete;
    auto operator=(const FdGuard&) -> FdGuard& = delete;

    // Movable
    FdGuard(FdGuard&& other) noexcept : m_fd(std::exchange(other.m_fd, -1)) {}

    auto operator=(FdGuard&& other) noexcept -> FdGuard& {
      if (this != &other) {
        if (m_fd >= 0)
          ::close(m_fd);
        m_fd = std::exchange(other.m_fd, -1);
      }
      return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int {
      return m_fd;
    }

    [[nodiscard]] auto release() noexcept -> int {
      return std::exchange(m_fd, -1);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
      return m_fd >= 0;
    }
  };

  /**
   * @brief Calls `func` until it stops failing with EINTR.
   */
  template <typename Func>
  auto RetryOnEintr(Func&& func) -> decltype(func()) {
    decltype(func()) result;

    do
      result = func();
    while (result == -1 && errno == EINTR);

    return result;
  }

  /**
   * @brief Closes a descriptor, treating EINTR as closed (the descriptor is gone either way on Linux and the BSDs).
   */
  [[nodiscard]] inline auto CloseFd(const int fd, const types::StringView what) -> types::Result<> {
    if (::close(fd) == -1 && errno != EINTR)
      ERR_ERRNO("close({})", what);

    return {};
  }

  [[nodiscard]] inline auto SetNonBlocking(const int fd, const bool enabled) -> types::Result<> {
    const int flags = ::fcntl(fd, F_GETFL, 0);

    if (flags == -1)
      ERR_ERRNO("fcntl(F_GETFL)");

    if (::fcntl(fd, F_SETFL, enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK)) == -1)
      ERR_ERRNO("fcntl(F_SETFL)");

    return {};
  }

  /**
   * @brief Waits until `fd` is ready for `events`.
   * @param timeout  None waits indefinitely.
   * @return True when ready, false when the timeout elapsed.
   */
  [[nodiscard]] inline auto PollFd(const int fd, const short events, const types::Option<types::Millis> timeout) -> types::Result<bool> {
    pollfd pfd { .fd = fd, .events = events, .revents = 0 };

    const int waitMs = timeout ? static_cast<int>(timeout->count()) : -1;
    const int ready  = RetryOnEintr([&] { return ::poll(&pfd, 1, waitMs); });

    if (ready == -1)
      ERR_ERRNO("poll");

    return ready > 0;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Kernel Identity (uname)
  // ─────────────────────────────────────────────────────────────────────────────

  struct UnameInfo {
    types::String sysname; // Operating system name
    types::String release; // Kernel release
    types::String machine; // Hardware identifier
  };

  [[nodiscard]] inline auto GetUnameInfo() -> types::Result<UnameInfo> {
    struct utsname uts;

    if (uname(&uts) == -1)
      ERR_ERRNO("uname");

    return UnameInfo {
      .sysname = types::String(uts.sysname),
      .release = types::String(uts.release),
      .machine = types::String(uts.machine),
    };
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // stat(2) mapping
  // ─────────────────────────────────────────────────────────────────────────────

  [[nodiscard]] inline auto EntryTypeOf(const mode_t mode) -> files::EntryType {
    if (S_ISREG(mode))
      return files::EntryType::File;
    if (S_ISDIR(mode))
      return files::EntryType::Directory;
    if (S_ISLNK(mode))
      return files::EntryType::Symlink;

    return files::EntryType::Other;
  }

  /**
   * @brief Owner bits, reduced to {readable, writable, executable}.
   */
  [[nodiscard]] constexpr auto PermissionsOf(const mode_t mode) -> files::Permissions {
    return {
      .readable   = (mode & S_IRUSR) != 0,
      .writable   = (mode & S_IWUSR) != 0,
      .executable = (mode & S_IXUSR) != 0,
    };
  }

  /**
   * @brief Applies reduced permissions to an existing mode.
   *
   * Each owner bit is set from the reduced value; group and other bits follow
   * the owner bit but only where the existing mode already grants them, so
   * umask-style restrictions survive a round trip.
   */
  [[nodiscard]] constexpr auto ApplyPermissions(const mode_t existing, const files::Permissions perms) -> mode_t {
    mode_t mode = existing & ~static_cast<mode_t>(S_IRWXU);

    if (perms.readable)
      mode |= S_IRUSR;
    else
      mode &= ~static_cast<mode_t>(S_IRGRP | S_IROTH);

    if (perms.writable)
      mode |= S_IWUSR;
    else
      mode &= ~static_cast<mode_t>(S_IWGRP | S_IWOTH);

    if (perms.executable)
      mode |= S_IXUSR | ((existing & S_IRGRP) ? S_IXGRP : 0) | ((existing & S_IROTH) ? S_IXOTH : 0);
    else
      mode &= ~static_cast<mode_t>(S_IXGRP | S_IXOTH);

    return mode & 07777;
  }

  [[nodiscard]] inline auto ToTimestamp(const timespec& spec) -> types::Timestamp {
    return types::Timestamp(std::chrono::duration_cast<types::Timestamp::duration>(
      std::chrono::seconds(spec.tv_sec) + std::chrono::nanoseconds(spec.tv_nsec)
    ));
  }

  [[nodiscard]] inline auto ToFileStat(const struct stat& info) -> files::FileStat {
    return {
      .size        = static_cast<types::u64>(info.st_size),
  #ifdef __APPLE__
      .modified    = ToTimestamp(info.st_mtimespec),
  #else
      .modified    = ToTimestamp(info.st_mtim),
  #endif
      .permissions = PermissionsOf(info.st_mode),
      .type        = EntryTypeOf(info.st_mode),
      .identity    = files::FileIdentity { .device = static_cast<types::u64>(info.st_dev), .file = static_cast<types::u64>(info.st_ino) },
    };
  }
} // namespace conduit::os::unix_shared

#endif // !defined(_WIN32)
