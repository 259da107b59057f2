#pragma once

#include "../Utils/Types.hpp"
#include "Capability.hpp"
#include "Config.hpp"
#include "Platform.hpp"

namespace conduit::core {
  namespace types = ::conduit::utils::types;

  /**
   * @class Context
   * @brief The platform profile, capability registry and configuration every adapter is built from.
   *
   * Adapters keep a reference to the Context they were constructed with, so a
   * Context must outlive every adapter and handle created through it. It is
   * immutable after construction and may be shared between threads.
   */
  class Context {
   public:
    /**
     * @brief Detects the host and builds the default registry with `config`'s overrides applied.
     * @return InvalidArgument if an override names an unknown operation.
     */
    static auto create(config::Config config = {}) -> types::Result<types::UniquePointer<Context>>;

    /**
     * @brief Builds a context from explicit parts; used to run adapters against a synthetic platform.
     */
    Context(platform::PlatformProfile profile, capability::CapabilityRegistry registry, config::Config config = {});

    Context(const Context&)                    = delete;
    Context(Context&&)                         = delete;
    auto operator=(const Context&) -> Context& = delete;
    auto operator=(Context&&) -> Context&      = delete;
    ~Context()                                 = default;

    [[nodiscard]] auto profile() const -> const platform::PlatformProfile& {
      return m_profile;
    }

    [[nodiscard]] auto registry() const -> const capability::CapabilityRegistry& {
      return m_registry;
    }

    [[nodiscard]] auto config() const -> const config::Config& {
      return m_config;
    }

    /**
     * @brief Shorthand for registry().resolve(operation, profile()).
     */
    [[nodiscard]] auto resolve(types::StringView operation) const -> capability::Resolution {
      return m_registry.resolve(operation, m_profile);
    }

   private:
    platform::PlatformProfile      m_profile;
    capability::CapabilityRegistry m_registry;
    config::Config                 m_config;
  };
} // namespace conduit::core
