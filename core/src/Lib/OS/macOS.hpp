#pragma once

#ifdef __APPLE__

  #include "OS/Posix/Posix.hpp"

namespace conduit::os::darwin {
  namespace types = ::conduit::utils::types;

  /**
   * @brief POSIX file backend with copyfile(3) for copies.
   */
  class DarwinFileBackend final : public posix::PosixFileBackend {
   public:
    auto copy(const types::String& from, const types::String& to, bool overwrite) -> types::Result<types::u64> override;
  };

  /**
   * @brief Mach task and host statistics on top of the getrusage CPU time.
   */
  class DarwinTelemetryBackend final : public posix::PosixTelemetryBackend {
   public:
    auto memory() -> types::Result<telemetry::MemoryUsage> override;
    auto systemMemoryUsed() -> types::Result<types::u64> override;
    auto io() -> types::Result<telemetry::IoCounters> override;
  };
} // namespace conduit::os::darwin

#endif // __APPLE__
