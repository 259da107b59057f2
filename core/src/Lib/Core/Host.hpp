#pragma once

#include <Conduit++/Core/Platform.hpp>
#include <Conduit++/Utils/Types.hpp>

namespace conduit::core::host {
  namespace types = ::conduit::utils::types;

  /**
   * @brief Raw identity strings reported by the running OS.
   */
  struct HostIdentity {
    types::String sysname;
    types::String release;
    types::String machine;
  };

  /**
   * @brief Queries the OS for its identity (uname on POSIX, RtlGetVersion on Windows).
   *
   * Never fails. Fields the OS would not report are left empty, which Classify
   * turns into Unknown.
   */
  auto QueryHostIdentity() -> HostIdentity;

  /**
   * @brief Adjusts the family baseline by probing the running host.
   *
   * Implemented per OS. Only clears flags the host turns out to lack, or sets
   * flags that depend on runtime state (mounted /proc, a reachable syslog).
   */
  auto ProbeCapabilities(const platform::PlatformProfile& classified) -> platform::Capability;
} // namespace conduit::core::host
