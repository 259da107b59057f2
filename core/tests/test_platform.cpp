#include <boost/ut.hpp>

#include <Conduit++/Core/Platform.hpp>
#include <Conduit++/Utils/Env.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace conduit::core::platform;
  using namespace conduit::utils::env;
  using namespace conduit::utils::types;

  "Version parsing"_test = [] -> void {
    expect(Version::parse("6.8.0-45-generic") == Version { 6, 8, 0 });
    expect(Version::parse("10.0.22631") == Version { 10, 0, 22631 });
    expect(Version::parse("23.4.0") == Version { 23, 4, 0 });
    expect(Version::parse("14.0-RELEASE-p5") == Version { 14, 0, 0 });
    expect(Version::parse("7") == Version { 7, 0, 0 });
    expect(Version::parse("garbage") == Version {});
    expect(Version::parse("") == Version {});
  };

  "Version ordering"_test = [] -> void {
    expect(Version { 5, 3, 0 } < Version { 5, 10, 0 });
    expect(Version { 10, 0, 19041 } < Version { 10, 0, 22631 });
    expect(Version { 1, 0, 0 } > Version { 0, 99, 99 });
  };

  "Architecture parsing"_test = [] -> void {
    expect(ParseArchitecture("x86_64") == Architecture::X86_64);
    expect(ParseArchitecture("AMD64") == Architecture::X86_64);
    expect(ParseArchitecture("i686") == Architecture::X86);
    expect(ParseArchitecture("aarch64") == Architecture::Arm64);
    expect(ParseArchitecture("arm64") == Architecture::Arm64);
    expect(ParseArchitecture("armv7l") == Architecture::Arm);
    expect(ParseArchitecture("riscv64") == Architecture::RiscV64);
    expect(ParseArchitecture("ppc64le") == Architecture::PowerPC64);
    expect(ParseArchitecture("s390x") == Architecture::Unknown);
  };

  "Classify Linux"_test = [] -> void {
    const PlatformProfile profile = Classify("Linux", "6.8.0-45-generic", "x86_64");

    expect(profile.family == PlatformFamily::Linux);
    expect(profile.version == Version { 6, 8, 0 });
    expect(profile.architecture == Architecture::X86_64);
    expect(profile.release == String("6.8.0-45-generic"));
    expect(profile.has(Capability::Fork | Capability::ProcFs));
    expect(!profile.has(Capability::EventLog));
    expect(profile.isPosix());
  };

  "Classify Windows"_test = [] -> void {
    const PlatformProfile profile = Classify("Windows_NT", "10.0.22631", "AMD64");

    expect(profile.family == PlatformFamily::Windows);
    expect(profile.version == Version { 10, 0, 22631 });
    expect(profile.has(Capability::EventLog));
    expect(!profile.has(Capability::Fork));
    expect(!profile.has(Capability::PosixSignals));
    expect(!profile.isPosix());
  };

  "Classify MSYS shells as Windows"_test = [] -> void {
    expect(Classify("MINGW64_NT-10.0-22631", "3.4.10", "x86_64").family == PlatformFamily::Windows);
    expect(Classify("MSYS_NT-10.0-22631", "3.4.10", "x86_64").family == PlatformFamily::Windows);
  };

  "Classify the BSDs, macOS and Haiku"_test = [] -> void {
    expect(Classify("Darwin", "14.4.1", "arm64").family == PlatformFamily::MacOS);
    expect(Classify("FreeBSD", "14.0-RELEASE", "amd64").family == PlatformFamily::FreeBSD);
    expect(Classify("NetBSD", "10.0", "amd64").family == PlatformFamily::NetBSD);
    expect(Classify("OpenBSD", "7.5", "amd64").family == PlatformFamily::OpenBSD);
    expect(Classify("DragonFly", "6.4-RELEASE", "x86_64").family == PlatformFamily::DragonFly);
    expect(Classify("Haiku", "1", "x86_64").family == PlatformFamily::Haiku);

    // The default APFS volume is case-insensitive until probed.
    expect(!Classify("Darwin", "14.4.1", "arm64").has(Capability::CaseSensitiveFs));
  };

  "Unknown sysname has no capabilities"_test = [] -> void {
    const PlatformProfile profile = Classify("Plan9", "4", "386");

    expect(profile.family == PlatformFamily::Unknown);
    expect(profile.capabilities == Capability::None);
    expect(!profile.isPosix());
  };

  "Classification is deterministic"_test = [] -> void {
    expect(Classify("Linux", "5.15.0", "aarch64") == Classify("Linux", "5.15.0", "aarch64"));
  };

  "Detect is cached"_test = [] -> void {
    const PlatformProfile& first  = Detect();
    const PlatformProfile& second = Detect();

    expect(&first == &second);
    expect(first.family != PlatformFamily::Unknown);

#ifdef _WIN32
    expect(first.family == PlatformFamily::Windows);
#elif defined(__linux__)
    expect(first.family == PlatformFamily::Linux);
#elif defined(__APPLE__)
    expect(first.family == PlatformFamily::MacOS);
#endif
  };

  "Separators"_test = [] -> void {
    expect(NativeSeparator(PlatformFamily::Windows) == '\\');
    expect(NativeSeparator(PlatformFamily::Linux) == '/');
    expect(PathListSeparator(PlatformFamily::Windows) == ';');
    expect(PathListSeparator(PlatformFamily::MacOS) == ':');
    expect(LineSeparator(PlatformFamily::Windows) == StringView("\r\n"));
    expect(LineSeparator(PlatformFamily::FreeBSD) == StringView("\n"));
  };

  "Family names"_test = [] -> void {
    expect(FamilyName(PlatformFamily::MacOS) == StringView("macOS"));
    expect(FamilyName(PlatformFamily::DragonFly) == StringView("DragonFly BSD"));
    expect(FamilyName(PlatformFamily::Unknown) == StringView("Unknown"));
  };

#ifndef _WIN32
  "XDG known directories"_test = [] -> void {
    const PlatformProfile xdg = Classify("Linux", "6.1", "x86_64");

    SetEnv("HOME", "/home/conduit");
    SetEnv("XDG_CONFIG_HOME", "/xdg/config/");
    UnsetEnv("XDG_CACHE_HOME");

    expect(GetKnownDirectory(xdg, KnownDirectory::Home) == String("/home/conduit"));
    expect(GetKnownDirectory(xdg, KnownDirectory::Config, "app") == String("/xdg/config/app"));
    expect(GetKnownDirectory(xdg, KnownDirectory::Cache) == String("/home/conduit/.cache"));

    UnsetEnv("XDG_CONFIG_HOME");
  };

  "macOS known directories"_test = [] -> void {
    const PlatformProfile mac = Classify("Darwin", "14.4", "arm64");

    SetEnv("HOME", "/Users/conduit");

    expect(GetKnownDirectory(mac, KnownDirectory::Config) == String("/Users/conduit/Library/Application Support"));
    expect(GetKnownDirectory(mac, KnownDirectory::Cache, "app") == String("/Users/conduit/Library/Caches/app"));
  };

  "Windows known directories use logical separators"_test = [] -> void {
    const PlatformProfile windows = Classify("Windows_NT", "10.0.22631", "AMD64");

    SetEnv("APPDATA", "C:\\Users\\conduit\\AppData\\Roaming");
    UnsetEnv("USERPROFILE");

    expect(GetKnownDirectory(windows, KnownDirectory::Config, "app") == String("C:/Users/conduit/AppData/Roaming/app"));

    const Result<String> home = GetKnownDirectory(windows, KnownDirectory::Home);

    expect(!home.has_value());
    expect(!home && home.error().kind == conduit::utils::error::ErrorKind::NotFound);

    UnsetEnv("APPDATA");
  };
#endif

  return 0;
}
