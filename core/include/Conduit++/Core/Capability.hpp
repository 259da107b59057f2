/**
 * @file Capability.hpp
 * @brief Maps abstract operation names to native backends or fallback policies.
 *
 * @details The registry is built once from a static table (optionally with
 * configured policy overrides) and is read-only afterwards, so `resolve` may be
 * called concurrently from any thread. Resolution is a pure function of the
 * operation name and the PlatformProfile.
 *
 * Matching rules for a descriptor's entries:
 *  - an entry matches when its family equals the profile's family, its version
 *    constraint (if any) matches, and every capability flag it requires is set;
 *  - among matching entries, the one with the most version components wins
 *    (exact major.minor beats major, which beats family-only);
 *  - equally specific matches resolve to the first one in table order;
 *  - an entry without a backend marks the operation as explicitly unavailable
 *    at that specificity, which hands resolution to the fallback policy;
 *  - an Emulate fallback applies only while every prerequisite operation has a
 *    native backend on the profile;
 *  - a NoOp fallback never applies to an Unknown platform family.
 */

#pragma once

#include <variant> // std::variant

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Platform.hpp"

namespace conduit::core::capability {
  namespace types = ::conduit::utils::types;

  /**
   * @enum FallbackPolicy
   * @brief What happens when no native backend is registered for the running platform.
   */
  enum class FallbackPolicy : types::u8 {
    Error,   ///< Surface ErrorKind::Unsupported.
    Emulate, ///< Rebuild the operation from other operations that are supported.
    NoOp,    ///< Succeed without doing anything; observably different from real execution.
  };

  /**
   * @enum BackendId
   * @brief Identifies a native implementation compiled into the library.
   */
  enum class BackendId : types::u8 {
    Posix,   ///< Portable POSIX calls shared by every Unix-like family.
    Linux,   ///< Linux-only calls (copy_file_range, /proc).
    Darwin,  ///< macOS-only calls (copyfile, Mach task info).
    Windows, ///< Win32 / Winsock.
  };

  struct CapabilityEntry {
    platform::PlatformFamily      family;
    types::Option<types::u32>     major;    ///< Version constraint; None matches any version.
    types::Option<types::u32>     minor;    ///< Only meaningful together with `major`.
    types::Option<BackendId>      backend;  ///< None: explicitly unavailable here.
    platform::Capability          required = platform::Capability::None; ///< Flags the host must have for this entry to match.

    [[nodiscard]] auto specificity() const -> types::u8 {
      return static_cast<types::u8>((major ? 1 : 0) + (major && minor ? 1 : 0));
    }

    [[nodiscard]] auto matches(const platform::PlatformProfile& profile) const -> bool;
  };

  /**
   * @struct CapabilityDescriptor
   * @brief Availability of one abstract operation across platforms.
   */
  struct CapabilityDescriptor {
    types::String                operation;
    types::Vec<CapabilityEntry>  entries;
    FallbackPolicy               fallback = FallbackPolicy::Error;
    types::String                note; ///< Describes how a NoOp/Emulate fallback differs from native execution.
    types::Vec<types::String>    prerequisites; ///< Operations the emulation is built from.
  };

  struct Supported {
    BackendId backend;

    auto operator==(const Supported&) const -> bool = default;
  };

  struct Fallback {
    FallbackPolicy policy;

    auto operator==(const Fallback&) const -> bool = default;
  };

  struct Unsupported {
    types::String reason;

    auto operator==(const Unsupported&) const -> bool = default;
  };

  using Resolution = std::variant<Supported, Fallback, Unsupported>;

  /**
   * @brief Human readable rendering of a resolution, used in diagnostics.
   */
  auto Describe(const Resolution& resolution) -> types::String;

  class CapabilityRegistry {
   public:
    explicit CapabilityRegistry(types::Vec<CapabilityDescriptor> table);

    /**
     * @brief Registry populated from the built-in table of every known operation.
     */
    static auto withDefaults() -> CapabilityRegistry;

    /**
     * @brief The built-in table itself.
     */
    static auto defaultTable() -> types::Vec<CapabilityDescriptor>;

    /**
     * @brief Returns a copy whose fallback policies are replaced for the named operations.
     * @return InvalidArgument if an override names an operation the registry does not know.
     */
    [[nodiscard]] auto withOverrides(const types::Map<types::String, FallbackPolicy>& overrides) const
      -> types::Result<CapabilityRegistry>;

    /**
     * @brief Resolves an operation for a platform. Pure and deterministic.
     *
     * Unknown operation names resolve to Unsupported. A fallback policy of Error
     * resolves to Unsupported rather than Fallback(Error).
     */
    [[nodiscard]] auto resolve(types::StringView operation, const platform::PlatformProfile& profile) const -> Resolution;

    [[nodiscard]] auto find(types::StringView operation) const -> const CapabilityDescriptor*;

    [[nodiscard]] auto operations() const -> types::Vec<types::StringView>;

   private:
    [[nodiscard]] auto nativeBackend(const CapabilityDescriptor& descriptor, const platform::PlatformProfile& profile) const
      -> types::Option<BackendId>;

    types::Vec<CapabilityDescriptor>         m_descriptors;
    types::UnorderedMap<types::String, types::usize> m_index;
  };
} // namespace conduit::core::capability
