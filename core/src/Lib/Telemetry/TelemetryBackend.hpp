#pragma once

#include <Conduit++/Core/Capability.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>
#include <Conduit++/Utils/Types.hpp>

namespace conduit::telemetry {
  namespace types = ::conduit::utils::types;

  struct MemoryUsage {
    types::u64 resident    = 0;
    types::u64 virtualSize = 0;
  };

  struct IoCounters {
    types::u64 readBytes  = 0;
    types::u64 writeBytes = 0;
  };

  /**
   * @brief Process and system resource counters.
   *
   * Only cpuTime is universal; the rest default to Unsupported and are
   * overridden by backends that have a source for them.
   */
  class TelemetryBackend {
   public:
    TelemetryBackend()                                           = default;
    TelemetryBackend(const TelemetryBackend&)                    = delete;
    TelemetryBackend(TelemetryBackend&&)                         = delete;
    auto operator=(const TelemetryBackend&) -> TelemetryBackend& = delete;
    auto operator=(TelemetryBackend&&) -> TelemetryBackend&      = delete;
    virtual ~TelemetryBackend()                                  = default;

    /// User + system CPU seconds consumed by this process.
    virtual auto cpuTime() -> types::Result<types::f64> = 0;

    virtual auto memory() -> types::Result<MemoryUsage> {
      ERR(utils::error::ErrorKind::Unsupported, "Process memory counters are not available from this backend");
    }

    virtual auto systemMemoryUsed() -> types::Result<types::u64> {
      ERR(utils::error::ErrorKind::Unsupported, "System memory counters are not available from this backend");
    }

    virtual auto io() -> types::Result<IoCounters> {
      ERR(utils::error::ErrorKind::Unsupported, "I/O counters are not available from this backend");
    }
  };

  /**
   * @brief The platform log: syslog on POSIX, the Event Log on Windows.
   */
  class NativeLogBackend {
   public:
    NativeLogBackend()                                           = default;
    NativeLogBackend(const NativeLogBackend&)                    = delete;
    NativeLogBackend(NativeLogBackend&&)                         = delete;
    auto operator=(const NativeLogBackend&) -> NativeLogBackend& = delete;
    auto operator=(NativeLogBackend&&) -> NativeLogBackend&      = delete;
    virtual ~NativeLogBackend()                                  = default;

    /**
     * @param ident  Must stay valid until close(); syslog keeps the pointer.
     */
    virtual auto open(const types::String& ident) -> types::Result<types::isize> = 0;

    virtual auto write(types::isize handle, utils::logging::LogLevel level, types::StringView text) -> types::Result<> = 0;

    virtual auto close(types::isize handle) -> types::Result<> = 0;
  };

  auto GetTelemetryBackend(core::capability::BackendId id) -> types::Result<TelemetryBackend*>;

  auto GetNativeLogBackend(core::capability::BackendId id) -> types::Result<NativeLogBackend*>;
} // namespace conduit::telemetry
