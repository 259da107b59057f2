#ifdef __linux__

  #include <cerrno>        // errno, EXDEV, ENOSYS, EINVAL
  #include <charconv>      // std::from_chars
  #include <concepts>      // std::integral
  #include <fcntl.h>       // open, O_RDONLY, O_WRONLY, O_CREAT, O_TRUNC, O_EXCL, O_CLOEXEC
  #include <fstream>       // std::ifstream
  #include <string>        // std::getline
  #include <sys/stat.h>    // fstat, fchmod
  #include <sys/sysinfo.h> // sysinfo
  #include <system_error>  // std::errc
  #include <unistd.h>      // copy_file_range, read, write, access, sysconf
  #include <utility>       // std::move

  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Logging.hpp>
  #include <Conduit++/Utils/Types.hpp>

  #include "Core/Host.hpp"
  #include "OS/Linux.hpp"
  #include "OS/Unix.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::platform::Capability;
using conduit::core::platform::PlatformProfile;

namespace unix_shared = conduit::os::unix_shared;

using unix_shared::FdGuard;

namespace {
  constexpr usize CopyChunk = 1 << 20;

  template <std::integral T>
  constexpr auto TryParse(StringView sview) -> Option<T> {
    T value;

    auto [ptr, ec] = std::from_chars(sview.data(), sview.data() + sview.size(), value);

    if (ec == std::errc() && ptr == sview.data() + sview.size())
      return value;

    return None;
  }

  auto ReadProcLine(const char* path) -> Result<String> {
    std::ifstream file(path);
    if (!file.is_open())
      ERR_FMT(NotFound, "Failed to open {}", path);

    String line;

    if (!std::getline(file, line))
      ERR_FMT(PlatformError, "{} is empty", path);

    return line;
  }

  /**
   * @brief Userspace copy for filesystems where copy_file_range refuses to work.
   */
  auto CopyByChunks(const int input, const int output, u64 copied) -> Result<u64> {
    Vec<char> buffer(CopyChunk);

    while (true) {
      const ssize_t count = unix_shared::RetryOnEintr([&] { return ::read(input, buffer.data(), buffer.size()); });

      if (count == -1)
        ERR_ERRNO("read during copy");

      if (count == 0)
        return copied;

      ssize_t written = 0;

      while (written < count) {
        const ssize_t step = unix_shared::RetryOnEintr([&] {
          return ::write(output, buffer.data() + written, static_cast<usize>(count - written));
        });

        if (step == -1)
          ERR_ERRNO("write during copy");

        written += step;
      }

      copied += static_cast<u64>(count);
    }
  }
} // namespace

namespace conduit::core::host {
  auto QueryHostIdentity() -> HostIdentity {
    Result<unix_shared::UnameInfo> uts = unix_shared::GetUnameInfo();

    if (!uts) {
      debug_at(uts.error());
      return {};
    }

    return { .sysname = std::move(uts->sysname), .release = std::move(uts->release), .machine = std::move(uts->machine) };
  }

  auto ProbeCapabilities(const PlatformProfile& classified) -> Capability {
    Capability caps = classified.capabilities;

    // Containers and chroots can lack a mounted /proc.
    if (::access("/proc/self/stat", R_OK) != 0) {
      debug_log("/proc/self is not readable; clearing ProcFs");
      caps &= ~Capability::ProcFs;
    }

    if (::access("/dev/log", F_OK) != 0) {
      debug_log("No syslog socket at /dev/log; clearing Syslog");
      caps &= ~Capability::Syslog;
    }

    return caps;
  }
} // namespace conduit::core::host

namespace conduit::os::linux_os {
  auto LinuxFileBackend::copy(const String& from, const String& to, const bool overwrite) -> Result<u64> {
    const FdGuard input(unix_shared::RetryOnEintr([&] { return ::open(from.c_str(), O_RDONLY | O_CLOEXEC); }));

    if (!input)
      ERR_ERRNO("open('{}')", from);

    struct stat info {};

    if (::fstat(input.get(), &info) == -1)
      ERR_ERRNO("fstat('{}')", from);

    if (S_ISDIR(info.st_mode))
      ERR_FMT(InvalidArgument, "Cannot copy directory '{}'", from);

    const int flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | (overwrite ? 0 : O_EXCL);

    const FdGuard output(unix_shared::RetryOnEintr([&] { return ::open(to.c_str(), flags, info.st_mode & 07777); }));

    if (!output)
      ERR_ERRNO("open('{}')", to);

    u64 copied = 0;

    while (true) {
      const ssize_t count = unix_shared::RetryOnEintr([&] {
        return ::copy_file_range(input.get(), nullptr, output.get(), nullptr, CopyChunk, 0);
      });

      if (count == -1) {
        // Cross-device copies before 5.3 and some FUSE/NFS mounts land here.
        if (errno == EXDEV || errno == ENOSYS || errno == EINVAL || errno == EOPNOTSUPP) {
          debug_log("copy_file_range('{}') unavailable (errno {}), copying in userspace", from, errno);
          copied = TRY(CopyByChunks(input.get(), output.get(), copied));
          break;
        }

        ERR_ERRNO("copy_file_range('{}', '{}')", from, to);
      }

      if (count == 0)
        break;

      copied += static_cast<u64>(count);
    }

    // The umask applied at creation; the source's bits are the contract.
    if (::fchmod(output.get(), info.st_mode & 07777) == -1)
      ERR_ERRNO("fchmod('{}')", to);

    return copied;
  }

  auto LinuxTelemetryBackend::memory() -> Result<telemetry::MemoryUsage> {
    const String statm = TRY(ReadProcLine("/proc/self/statm"));

    const usize split = statm.find(' ');

    if (split == String::npos)
      ERR_FMT(PlatformError, "Unexpected /proc/self/statm format: '{}'", statm);

    const usize residentEnd = statm.find(' ', split + 1);

    const Option<u64> sizePages     = TryParse<u64>(StringView(statm).substr(0, split));
    const Option<u64> residentPages = TryParse<u64>(StringView(statm).substr(split + 1, residentEnd - split - 1));

    if (!sizePages || !residentPages)
      ERR_FMT(PlatformError, "Unexpected /proc/self/statm format: '{}'", statm);

    const long pageSize = ::sysconf(_SC_PAGESIZE);

    if (pageSize <= 0)
      ERR_ERRNO("sysconf(_SC_PAGESIZE)");

    return telemetry::MemoryUsage {
      .resident    = *residentPages * static_cast<u64>(pageSize),
      .virtualSize = *sizePages * static_cast<u64>(pageSize),
    };
  }

  auto LinuxTelemetryBackend::systemMemoryUsed() -> Result<u64> {
    struct sysinfo info {};

    if (::sysinfo(&info) != 0)
      ERR_ERRNO("sysinfo");

    if (info.mem_unit == 0)
      ERR(PlatformError, "sysinfo.mem_unit is 0, cannot calculate memory");

    return static_cast<u64>(info.totalram - info.freeram - info.bufferram) * info.mem_unit;
  }

  auto LinuxTelemetryBackend::io() -> Result<telemetry::IoCounters> {
    // Requires CONFIG_TASK_IO_ACCOUNTING.
    std::ifstream file("/proc/self/io");
    if (!file.is_open())
      ERR(NotFound, "Failed to open /proc/self/io");

    Option<u64> readBytes;
    Option<u64> writeBytes;

    String line;

    while (std::getline(file, line)) {
      const StringView view(line);
      const usize      colon = view.find(':');

      if (colon == StringView::npos)
        continue;

      const StringView key   = view.substr(0, colon);
      StringView       value = view.substr(colon + 1);

      while (!value.empty() && value.front() == ' ')
        value.remove_prefix(1);

      if (key == "read_bytes")
        readBytes = TryParse<u64>(value);
      else if (key == "write_bytes")
        writeBytes = TryParse<u64>(value);
    }

    if (!readBytes || !writeBytes)
      ERR(PlatformError, "read_bytes/write_bytes missing from /proc/self/io");

    return telemetry::IoCounters { .readBytes = *readBytes, .writeBytes = *writeBytes };
  }
} // namespace conduit::os::linux_os

#endif // __linux__
