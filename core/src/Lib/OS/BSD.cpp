#if defined(__FreeBSD__) || defined(__DragonFly__) || defined(__NetBSD__) || defined(__OpenBSD__)

  #include <unistd.h> // access
  #include <utility>  // std::move

  #include <Conduit++/Utils/Logging.hpp>
  #include <Conduit++/Utils/Types.hpp>

  #include "Core/Host.hpp"
  #include "OS/Unix.hpp"

using namespace conduit::utils::types;
using conduit::core::platform::Capability;
using conduit::core::platform::PlatformProfile;

namespace {
  // syslogd's local socket; NetBSD and OpenBSD use the same path.
  constexpr const char* SyslogSocket = "/var/run/log";
} // namespace

namespace conduit::core::host {
  auto QueryHostIdentity() -> HostIdentity {
    Result<os::unix_shared::UnameInfo> uts = os::unix_shared::GetUnameInfo();

    if (!uts) {
      debug_at(uts.error());
      return {};
    }

    return { .sysname = std::move(uts->sysname), .release = std::move(uts->release), .machine = std::move(uts->machine) };
  }

  auto ProbeCapabilities(const PlatformProfile& classified) -> Capability {
    Capability caps = classified.capabilities;

    if (::access(SyslogSocket, F_OK) != 0) {
      debug_log("No syslog socket at {}; clearing Syslog", SyslogSocket);
      caps &= ~Capability::Syslog;
    }

    return caps;
  }
} // namespace conduit::core::host

#endif
