#include <algorithm>   // std::ranges::transform
#include <cctype>      // std::tolower
#include <charconv>    // std::from_chars
#include <matchit.hpp> // matchit::{match, is, or_, _}

#include <Conduit++/Core/Platform.hpp>
#include <Conduit++/Utils/Env.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

#include "Core/Host.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::utils::env::GetEnv;

namespace {
  auto ToLower(StringView text) -> String {
    String out(text);
    std::ranges::transform(out, out.begin(), [](const unsigned char chr) -> char { return static_cast<char>(std::tolower(chr)); });
    return out;
  }

  auto ReadNumber(StringView& text) -> Option<u32> {
    u32 value = 0;

    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);

    if (ec != std::errc() || ptr == text.data())
      return None;

    text.remove_prefix(static_cast<usize>(ptr - text.data()));
    return value;
  }

  auto ToLogicalSlashes(String path) -> String {
    std::ranges::replace(path, '\\', '/');
    return path;
  }
} // namespace

namespace conduit::core::platform {
  auto Version::parse(StringView text) -> Version {
    Version version;

    const Option<u32> major = ReadNumber(text);
    if (!major)
      return version;

    version.major = *major;

    if (text.starts_with('.')) {
      text.remove_prefix(1);
      if (const Option<u32> minor = ReadNumber(text)) {
        version.minor = *minor;

        if (text.starts_with('.')) {
          text.remove_prefix(1);
          if (const Option<u32> patch = ReadNumber(text))
            version.patch = *patch;
        }
      }
    }

    return version;
  }

  auto ParseArchitecture(const StringView machine) -> Architecture {
    using namespace matchit;
    using enum Architecture;

    const String lowered = ToLower(machine);

    if (lowered.starts_with("armv") || lowered == "arm")
      return Arm;

    // clang-format off
    return match(StringView(lowered))(
      is | or_("x86_64", "amd64", "x64")                   = X86_64,
      is | or_("i386", "i486", "i586", "i686", "x86")      = X86,
      is | or_("aarch64", "arm64", "aarch64_be")           = Arm64,
      is | "riscv64"                                       = RiscV64,
      is | or_("ppc64", "ppc64le", "powerpc64")            = PowerPC64,
      is | _                                               = Unknown
    );
    // clang-format on
  }

  auto BaselineCapabilities(const PlatformFamily family) -> Capability {
    using enum Capability;

    constexpr Capability posixCore = PosixSignals | ProcessGroups | Fork | Symlinks | Syslog | UnixSockets;

    switch (family) {
      case PlatformFamily::Linux:     return posixCore | ProcFs | CaseSensitiveFs | KeepAliveTuning;
      case PlatformFamily::MacOS:     return posixCore | KeepAliveTuning;
      case PlatformFamily::FreeBSD:
      case PlatformFamily::DragonFly: return posixCore | CaseSensitiveFs | KeepAliveTuning;
      case PlatformFamily::NetBSD:
      case PlatformFamily::OpenBSD:   return posixCore | CaseSensitiveFs;
      case PlatformFamily::Haiku:     return PosixSignals | Fork | Symlinks | Syslog | CaseSensitiveFs | UnixSockets;
      case PlatformFamily::Windows:   return EventLog | KeepAliveTuning;
      case PlatformFamily::Unknown:   return None;
    }

    return None;
  }

  auto Classify(const StringView sysname, const StringView release, const StringView machine) -> PlatformProfile {
    using namespace matchit;
    using enum PlatformFamily;

    PlatformFamily family = match(sysname)(
      is | "Linux"                      = Linux,
      is | "Darwin"                     = MacOS,
      is | or_("Windows", "Windows_NT") = Windows,
      is | "FreeBSD"                    = FreeBSD,
      is | "NetBSD"                     = NetBSD,
      is | "OpenBSD"                    = OpenBSD,
      is | "DragonFly"                  = DragonFly,
      is | "Haiku"                      = Haiku,
      is | _                            = Unknown
    );

    // MSYS2 and MinGW shells report e.g. "MINGW64_NT-10.0-22631".
    if (family == Unknown && (sysname.starts_with("MINGW") || sysname.starts_with("MSYS")))
      family = Windows;

    return PlatformProfile {
      .family       = family,
      .version      = Version::parse(release),
      .architecture = ParseArchitecture(machine),
      .capabilities = BaselineCapabilities(family),
      .release      = String(release),
    };
  }

  auto Detect() -> const PlatformProfile& {
    static const PlatformProfile Profile = [] -> PlatformProfile {
      const host::HostIdentity identity = host::QueryHostIdentity();

      PlatformProfile profile = Classify(identity.sysname, identity.release, identity.machine);

      if (profile.family != PlatformFamily::Unknown)
        profile.capabilities = host::ProbeCapabilities(profile);
      else
        warn_log("Unrecognized platform '{}' ({}); every operation resolves through its fallback policy", identity.sysname, identity.release);

      debug_log_fields(
        Fields(
          field(family, FamilyName(profile.family)),
          field(version, std::format("{}.{}.{}", profile.version.major, profile.version.minor, profile.version.patch)),
          field(arch, magic_enum::enum_name(profile.architecture)),
          field(caps, static_cast<u16>(profile.capabilities))
        ),
        "Platform detected"
      );

      return profile;
    }();

    return Profile;
  }

  auto FamilyName(const PlatformFamily family) -> StringView {
    switch (family) {
      case PlatformFamily::Linux:     return "Linux";
      case PlatformFamily::Windows:   return "Windows";
      case PlatformFamily::MacOS:     return "macOS";
      case PlatformFamily::FreeBSD:   return "FreeBSD";
      case PlatformFamily::NetBSD:    return "NetBSD";
      case PlatformFamily::OpenBSD:   return "OpenBSD";
      case PlatformFamily::DragonFly: return "DragonFly BSD";
      case PlatformFamily::Haiku:     return "Haiku";
      case PlatformFamily::Unknown:   return "Unknown";
    }

    return "Unknown";
  }

  auto GetKnownDirectory(const PlatformProfile& profile, const KnownDirectory dir, const Option<StringView> appName) -> Result<String> {
    using enum KnownDirectory;

    const auto withApp = [&](String base) -> Result<String> {
      base = ToLogicalSlashes(std::move(base));

      while (base.size() > 1 && base.back() == '/')
        base.pop_back();

      if (appName && !appName->empty()) {
        base += '/';
        base += *appName;
      }

      return base;
    };

    const auto envOr = [](const PCStr name, const Fn<Result<String>()>& fallback) -> Result<String> {
      if (Result<String> value = GetEnv(name); value && !value->empty())
        return value;

      return fallback();
    };

    if (profile.family == PlatformFamily::Windows) {
      const auto requireEnv = [](const PCStr name) -> Fn<Result<String>()> {
        return [name] -> Result<String> { ERR_FMT(NotFound, "%{}% is not set", name); };
      };

      switch (dir) {
        case Home:   return withApp(TRY(envOr("USERPROFILE", requireEnv("USERPROFILE"))));
        case Config: return withApp(TRY(envOr("APPDATA", requireEnv("APPDATA"))));
        case Data:   return withApp(TRY(envOr("LOCALAPPDATA", requireEnv("LOCALAPPDATA"))));
        case Cache:  return withApp(TRY(envOr("LOCALAPPDATA", requireEnv("LOCALAPPDATA"))) + "/Temp");
        case Temp:   return withApp(TRY(envOr("TEMP", [] -> Result<String> { return GetEnv("TMP"); })));
      }
    }

    if (dir == Temp)
      return withApp(TRY(envOr("TMPDIR", [] -> Result<String> { return String("/tmp"); })));

    const String home = TRY(GetEnv("HOME"));

    if (profile.family == PlatformFamily::MacOS) {
      switch (dir) {
        case Home:   return withApp(home);
        case Config:
        case Data:   return withApp(home + "/Library/Application Support");
        case Cache:  return withApp(home + "/Library/Caches");
        case Temp:   break;
      }
    }

    switch (dir) {
      case Home:   return withApp(home);
      case Config: return withApp(TRY(envOr("XDG_CONFIG_HOME", [&] -> Result<String> { return home + "/.config"; })));
      case Cache:  return withApp(TRY(envOr("XDG_CACHE_HOME", [&] -> Result<String> { return home + "/.cache"; })));
      case Data:   return withApp(TRY(envOr("XDG_DATA_HOME", [&] -> Result<String> { return home + "/.local/share"; })));
      case Temp:   break;
    }

    ERR(InvalidArgument, "Unknown directory kind");
  }
} // namespace conduit::core::platform
