#include <Conduit++/Core/Context.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

using namespace conduit::utils::types;

namespace conduit::core {
  auto Context::create(config::Config config) -> Result<UniquePointer<Context>> {
    utils::logging::SetRuntimeLogLevel(config.logLevel);

    capability::CapabilityRegistry registry =
      TRY(capability::CapabilityRegistry::withDefaults().withOverrides(config.fallbackPolicyOverrides));

    return std::make_unique<Context>(platform::Detect(), std::move(registry), std::move(config));
  }

  Context::Context(platform::PlatformProfile profile, capability::CapabilityRegistry registry, config::Config config)
    : m_profile(std::move(profile)), m_registry(std::move(registry)), m_config(std::move(config)) {
    debug_log(
      "Context ready for {} {}.{} with {} operations",
      platform::FamilyName(m_profile.family),
      m_profile.version.major,
      m_profile.version.minor,
      m_registry.operations().size()
    );
  }
} // namespace conduit::core
