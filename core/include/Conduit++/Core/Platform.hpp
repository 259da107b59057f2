/**
 * @file Platform.hpp
 * @brief Host platform detection: OS family, version, architecture and capability flags.
 *
 * @details The detector runs once per process. Its result, a PlatformProfile,
 * is immutable and safe to read from any thread without synchronization. An
 * unrecognized host never causes a failure: it yields a profile whose family is
 * PlatformFamily::Unknown and whose capability flags are all cleared, which the
 * capability registry then resolves to fallbacks or Unsupported.
 */

#pragma once

#include <compare> // std::strong_ordering

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace conduit::core::platform {
  namespace types = ::conduit::utils::types;

  enum class PlatformFamily : types::u8 {
    Unknown,
    Linux,
    Windows,
    MacOS,
    FreeBSD,
    NetBSD,
    OpenBSD,
    DragonFly,
    Haiku,
  };

  enum class Architecture : types::u8 {
    Unknown,
    X86,
    X86_64,
    Arm,
    Arm64,
    RiscV64,
    PowerPC64,
  };

  /**
   * @enum Capability
   * @brief Bit flags describing facilities the running host actually provides.
   */
  enum class Capability : types::u16 {
    None            = 0,
    PosixSignals    = 1 << 0, ///< kill(2)-style signal delivery with arbitrary signal numbers.
    ProcessGroups   = 1 << 1, ///< Children can be placed in their own process group.
    Fork            = 1 << 2, ///< fork/exec process model.
    ProcFs          = 1 << 3, ///< A readable /proc/self hierarchy.
    CaseSensitiveFs = 1 << 4, ///< The default filesystem distinguishes "a" from "A".
    Symlinks        = 1 << 5, ///< Unprivileged symbolic links.
    Syslog          = 1 << 6, ///< syslog(3) is available as the native event log.
    EventLog        = 1 << 7, ///< Windows Event Log is available as the native event log.
    UnixSockets     = 1 << 8, ///< AF_UNIX stream sockets.
    KeepAliveTuning = 1 << 9, ///< Per-socket keep-alive timers.
  };

  constexpr auto operator|(Capability lhs, Capability rhs) -> Capability {
    return static_cast<Capability>(static_cast<types::u16>(lhs) | static_cast<types::u16>(rhs));
  }

  constexpr auto operator|=(Capability& lhs, Capability rhs) -> Capability& {
    return lhs = lhs | rhs;
  }

  constexpr auto operator&(Capability lhs, Capability rhs) -> Capability {
    return static_cast<Capability>(static_cast<types::u16>(lhs) & static_cast<types::u16>(rhs));
  }

  constexpr auto operator~(Capability flags) -> Capability {
    return static_cast<Capability>(static_cast<types::u16>(~static_cast<types::u16>(flags)));
  }

  constexpr auto operator&=(Capability& lhs, Capability rhs) -> Capability& {
    return lhs = lhs & rhs;
  }

  /**
   * @brief True when every flag in `required` is present in `flags`.
   */
  constexpr auto HasCapabilities(const Capability flags, const Capability required) -> bool {
    return (flags & required) == required;
  }

  /**
   * @struct Version
   * @brief A three-component OS version. Missing components are zero.
   */
  struct Version {
    types::u32 major = 0;
    types::u32 minor = 0;
    types::u32 patch = 0;

    auto operator<=>(const Version&) const = default;

    /**
     * @brief Parses the leading dotted-number run of a release string.
     * @details "6.8.0-45-generic" -> 6.8.0, "10.0.22631" -> 10.0.22631, "garbage" -> 0.0.0.
     */
    static auto parse(types::StringView text) -> Version;
  };

  /**
   * @struct PlatformProfile
   * @brief Immutable description of the host, produced once by Detect().
   */
  struct PlatformProfile {
    PlatformFamily family       = PlatformFamily::Unknown;
    Version        version;
    Architecture   architecture = Architecture::Unknown;
    Capability     capabilities = Capability::None;
    types::String  release; ///< Raw release string as reported by the OS.

    auto operator==(const PlatformProfile&) const -> bool = default;

    [[nodiscard]] auto has(const Capability required) const -> bool {
      return HasCapabilities(capabilities, required);
    }

    [[nodiscard]] auto isPosix() const -> bool {
      return family != PlatformFamily::Unknown && family != PlatformFamily::Windows;
    }
  };

  /**
   * @brief Returns the cached profile of the running host.
   *
   * The first call probes the OS; later calls (from any thread) return the same
   * object. Never fails.
   */
  auto Detect() -> const PlatformProfile&;

  /**
   * @brief Builds a profile from raw uname-style identity strings.
   * @param sysname  Kernel/OS name ("Linux", "Darwin", "Windows_NT", ...).
   * @param release  Release or product version string.
   * @param machine  Hardware name ("x86_64", "arm64", "AMD64", ...).
   *
   * Pure function: no probing. Capability flags are the family baseline; an
   * unrecognized sysname yields PlatformFamily::Unknown with no capabilities.
   */
  auto Classify(types::StringView sysname, types::StringView release, types::StringView machine) -> PlatformProfile;

  /**
   * @brief Maps a machine string to an Architecture.
   */
  auto ParseArchitecture(types::StringView machine) -> Architecture;

  /**
   * @brief Capability flags every host of `family` is assumed to provide before probing.
   */
  auto BaselineCapabilities(PlatformFamily family) -> Capability;

  /**
   * @brief Friendly family name ("Linux", "Windows", "macOS", ...).
   */
  auto FamilyName(PlatformFamily family) -> types::StringView;

  /**
   * @brief Native directory separator for a family.
   */
  constexpr auto NativeSeparator(const PlatformFamily family) -> char {
    return family == PlatformFamily::Windows ? '\\' : '/';
  }

  /**
   * @brief Separator between entries of PATH-like variables.
   */
  constexpr auto PathListSeparator(const PlatformFamily family) -> char {
    return family == PlatformFamily::Windows ? ';' : ':';
  }

  constexpr auto LineSeparator(const PlatformFamily family) -> types::StringView {
    return family == PlatformFamily::Windows ? "\r\n" : "\n";
  }

  enum class KnownDirectory : types::u8 {
    Home,
    Config,
    Cache,
    Data,
    Temp,
  };

  /**
   * @brief Resolves a per-user well-known directory as a logical path.
   * @param profile  Platform whose conventions apply.
   * @param dir      Which directory.
   * @param appName  Optional application subdirectory appended to the result.
   * @return NotFound if the environment lacks the variables the convention relies on.
   *
   * Conventions:
   *  - Windows: %USERPROFILE%, %LOCALAPPDATA%, %LOCALAPPDATA%\\Temp, %APPDATA%, %TEMP%
   *  - macOS:   ~/Library/Application Support, ~/Library/Caches, $TMPDIR
   *  - Others:  $XDG_CONFIG_HOME, $XDG_CACHE_HOME, $XDG_DATA_HOME with ~/.config, ~/.cache, ~/.local/share defaults
   */
  auto GetKnownDirectory(const PlatformProfile& profile, KnownDirectory dir, types::Option<types::StringView> appName = types::None)
    -> types::Result<types::String>;
} // namespace conduit::core::platform
