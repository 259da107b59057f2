#ifdef __APPLE__

  #include <cerrno>               // errno
  #include <copyfile.h>           // copyfile, COPYFILE_DATA, COPYFILE_EXCL
  #include <format>               // std::format
  #include <libproc.h>            // proc_pid_rusage, rusage_info_v2
  #include <mach/mach.h>          // task_info, mach_task_self, MACH_TASK_BASIC_INFO
  #include <mach/mach_error.h>    // mach_error_string
  #include <mach/mach_host.h>     // host_statistics64
  #include <mach/mach_init.h>     // host_page_size, mach_host_self
  #include <mach/vm_statistics.h> // vm_statistics64_data_t
  #include <sys/stat.h>           // stat, chmod
  #include <sys/sysctl.h>         // sysctlbyname
  #include <unistd.h>             // getpid, pathconf
  #include <utility>              // std::move

  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Logging.hpp>
  #include <Conduit++/Utils/Types.hpp>

  #include "Core/Host.hpp"
  #include "OS/Unix.hpp"
  #include "OS/macOS.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::platform::Capability;
using conduit::core::platform::PlatformProfile;

namespace {
  /**
   * @brief Product version ("14.4.1"); uname only knows the Darwin kernel release.
   */
  auto ProductVersion() -> Option<String> {
    Array<char, 32> version {};
    usize           len = version.size();

    if (::sysctlbyname("kern.osproductversion", version.data(), &len, nullptr, 0) == -1) {
      debug_log("sysctlbyname('kern.osproductversion') failed (errno {})", errno);
      return None;
    }

    return String(version.data());
  }
} // namespace

namespace conduit::core::host {
  auto QueryHostIdentity() -> HostIdentity {
    Result<os::unix_shared::UnameInfo> uts = os::unix_shared::GetUnameInfo();

    if (!uts) {
      debug_at(uts.error());
      return {};
    }

    return {
      .sysname = std::move(uts->sysname),
      .release = ProductVersion().value_or(std::move(uts->release)),
      .machine = std::move(uts->machine),
    };
  }

  auto ProbeCapabilities(const PlatformProfile& classified) -> Capability {
    Capability caps = classified.capabilities;

    // APFS and HFS+ are case-insensitive by default but can be formatted otherwise.
    if (::pathconf("/", _PC_CASE_SENSITIVE) == 1)
      caps |= Capability::CaseSensitiveFs;

    return caps;
  }
} // namespace conduit::core::host

namespace conduit::os::darwin {
  auto DarwinFileBackend::copy(const String& from, const String& to, const bool overwrite) -> Result<u64> {
    struct stat info {};

    if (::stat(from.c_str(), &info) == -1)
      ERR_ERRNO("stat('{}')", from);

    if (S_ISDIR(info.st_mode))
      ERR_FMT(InvalidArgument, "Cannot copy directory '{}'", from);

    const copyfile_flags_t flags = COPYFILE_DATA | (overwrite ? 0 : COPYFILE_EXCL);

    if (::copyfile(from.c_str(), to.c_str(), nullptr, flags) != 0)
      ERR_ERRNO("copyfile('{}', '{}')", from, to);

    if (::chmod(to.c_str(), info.st_mode & 07777) == -1)
      ERR_ERRNO("chmod('{}')", to);

    return static_cast<u64>(info.st_size);
  }

  auto DarwinTelemetryBackend::memory() -> Result<telemetry::MemoryUsage> {
    mach_task_basic_info_data_t info {};
    mach_msg_type_number_t      count = MACH_TASK_BASIC_INFO_COUNT;

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) - Mach takes an untyped info pointer
    if (const kern_return_t kr = ::task_info(mach_task_self(), MACH_TASK_BASIC_INFO, reinterpret_cast<task_info_t>(&info), &count); kr != KERN_SUCCESS)
      return Err(utils::error::ConduitError(PlatformError, std::format("task_info(MACH_TASK_BASIC_INFO) failed: {}", ::mach_error_string(kr)), static_cast<i64>(kr)));

    return telemetry::MemoryUsage {
      .resident    = static_cast<u64>(info.resident_size),
      .virtualSize = static_cast<u64>(info.virtual_size),
    };
  }

  auto DarwinTelemetryBackend::systemMemoryUsed() -> Result<u64> {
    static mach_port_t HostPort = mach_host_self();

    vm_size_t pageSize = 0;

    if (host_page_size(HostPort, &pageSize) != KERN_SUCCESS)
      ERR(PlatformError, "host_page_size failed");

    vm_statistics64_data_t vmStats;
    mach_msg_type_number_t infoCount = sizeof(vmStats) / sizeof(natural_t);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    if (host_statistics64(HostPort, HOST_VM_INFO64, reinterpret_cast<host_info64_t>(&vmStats), &infoCount) != KERN_SUCCESS)
      ERR(PlatformError, "host_statistics64 failed to get memory statistics");

    // Active plus wired pages; inactive and compressed pages are reclaimable.
    return (static_cast<u64>(vmStats.active_count) + vmStats.wire_count) * pageSize;
  }

  auto DarwinTelemetryBackend::io() -> Result<telemetry::IoCounters> {
    rusage_info_v2 usage {};

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    if (::proc_pid_rusage(::getpid(), RUSAGE_INFO_V2, reinterpret_cast<rusage_info_t*>(&usage)) != 0)
      ERR_ERRNO("proc_pid_rusage");

    return telemetry::IoCounters { .readBytes = usage.ri_diskio_bytesread, .writeBytes = usage.ri_diskio_byteswritten };
  }
} // namespace conduit::os::darwin

#endif // __APPLE__
