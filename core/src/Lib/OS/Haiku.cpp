#ifdef __HAIKU__

  #include <utility> // std::move

  #include <Conduit++/Utils/Logging.hpp>
  #include <Conduit++/Utils/Types.hpp>

  #include "Core/Host.hpp"
  #include "OS/Unix.hpp"

using namespace conduit::utils::types;
using conduit::core::platform::Capability;
using conduit::core::platform::PlatformProfile;

namespace conduit::core::host {
  auto QueryHostIdentity() -> HostIdentity {
    Result<os::unix_shared::UnameInfo> uts = os::unix_shared::GetUnameInfo();

    if (!uts) {
      debug_at(uts.error());
      return {};
    }

    // The release is the build tag ("hrev57937"), which parses as version 0.0.0.
    return { .sysname = std::move(uts->sysname), .release = std::move(uts->release), .machine = std::move(uts->machine) };
  }

  auto ProbeCapabilities(const PlatformProfile& classified) -> Capability {
    // Nothing on Haiku varies from the family baseline at runtime.
    return classified.capabilities;
  }
} // namespace conduit::core::host

#endif // __HAIKU__
