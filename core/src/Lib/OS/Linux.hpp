#pragma once

#ifdef __linux__

  #include "OS/Posix/Posix.hpp"

namespace conduit::os::linux_os {
  namespace types = ::conduit::utils::types;

  /**
   * @brief POSIX file backend with an in-kernel copy (copy_file_range, Linux 4.5+).
   */
  class LinuxFileBackend final : public posix::PosixFileBackend {
   public:
    auto copy(const types::String& from, const types::String& to, bool overwrite) -> types::Result<types::u64> override;
  };

  /**
   * @brief Adds /proc and sysinfo counters to the getrusage CPU time.
   */
  class LinuxTelemetryBackend final : public posix::PosixTelemetryBackend {
   public:
    auto memory() -> types::Result<telemetry::MemoryUsage> override;
    auto systemMemoryUsed() -> types::Result<types::u64> override;
    auto io() -> types::Result<telemetry::IoCounters> override;
  };
} // namespace conduit::os::linux_os

#endif // __linux__
