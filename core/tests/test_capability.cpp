#include <boost/ut.hpp>

#include <Conduit++/Core/Capability.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Core/Platform.hpp>

using namespace boost::ut;
using namespace conduit::core::capability;
using namespace conduit::utils::types;

namespace ops = conduit::core::ops;

using conduit::core::platform::Capability;
using conduit::core::platform::Classify;
using conduit::core::platform::PlatformFamily;
using conduit::core::platform::PlatformProfile;

namespace {
  auto Profile(const PlatformFamily family, const u32 major, const u32 minor = 0) -> PlatformProfile {
    PlatformProfile profile = Classify(family == PlatformFamily::Windows ? "Windows_NT" : "Linux", "0", "x86_64");

    profile.family        = family;
    profile.version.major = major;
    profile.version.minor = minor;

    return profile;
  }

  auto IsSupportedBy(const Resolution& resolution, const BackendId backend) -> bool {
    return resolution == Resolution(Supported { backend });
  }
} // namespace

auto main() -> int {
  const CapabilityRegistry registry = CapabilityRegistry::withDefaults();

  const PlatformProfile linux6   = Classify("Linux", "6.8.0-45-generic", "x86_64");
  const PlatformProfile linux44  = Classify("Linux", "4.4.0", "x86_64");
  const PlatformProfile linux45  = Classify("Linux", "4.5.0", "x86_64");
  const PlatformProfile windows  = Classify("Windows_NT", "10.0.22631", "AMD64");
  const PlatformProfile mac      = Classify("Darwin", "23.4.0", "arm64");
  const PlatformProfile haiku    = Classify("Haiku", "1", "x86_64");
  const PlatformProfile netbsd   = Classify("NetBSD", "10.0", "amd64");
  const PlatformProfile unknown  = Classify("Plan9", "4", "386");

  "Portable operations resolve everywhere"_test = [&] -> void {
    expect(IsSupportedBy(registry.resolve(ops::FileOpen, linux6), BackendId::Posix));
    expect(IsSupportedBy(registry.resolve(ops::FileOpen, mac), BackendId::Posix));
    expect(IsSupportedBy(registry.resolve(ops::FileOpen, windows), BackendId::Windows));
    expect(IsSupportedBy(registry.resolve(ops::ProcessSpawn, haiku), BackendId::Posix));
    expect(IsSupportedBy(registry.resolve(ops::NetConnect, netbsd), BackendId::Posix));
  };

  "Tree removal is native on Linux and emulated on Windows and Haiku"_test = [&] -> void {
    expect(IsSupportedBy(registry.resolve(ops::FileRemoveAll, linux6), BackendId::Posix));
    expect(registry.resolve(ops::FileRemoveAll, windows) == Resolution(Fallback { FallbackPolicy::Emulate }));
    expect(registry.resolve(ops::FileRemoveAll, haiku) == Resolution(Fallback { FallbackPolicy::Emulate }));
  };

  "More specific version entries win"_test = [&] -> void {
    expect(IsSupportedBy(registry.resolve(ops::FileCopy, linux6), BackendId::Linux));
    expect(IsSupportedBy(registry.resolve(ops::FileCopy, linux45), BackendId::Linux));
    expect(registry.resolve(ops::FileCopy, linux44) == Resolution(Fallback { FallbackPolicy::Emulate }));
    expect(registry.resolve(ops::FileCopy, Profile(PlatformFamily::Linux, 3, 10)) == Resolution(Fallback { FallbackPolicy::Emulate }));
    expect(IsSupportedBy(registry.resolve(ops::FileCopy, mac), BackendId::Darwin));
    expect(IsSupportedBy(registry.resolve(ops::FileCopy, windows), BackendId::Windows));
  };

  "Custom signals are unsupported on Windows"_test = [&] -> void {
    const Resolution resolution = registry.resolve(ops::ProcessSignalCustom, windows);

    expect(std::holds_alternative<Unsupported>(resolution));
    expect(IsSupportedBy(registry.resolve(ops::ProcessSignalCustom, linux6), BackendId::Posix));
  };

  "Fallback(Error) is reported as Unsupported"_test = [&] -> void {
    const Resolution resolution = registry.resolve(ops::MonitorMemory, haiku);

    expect(std::holds_alternative<Unsupported>(resolution));
    expect(std::get<Unsupported>(resolution).reason.contains("Haiku"));
  };

  "Required capabilities gate entries"_test = [&] -> void {
    PlatformProfile noProc = linux6;
    noProc.capabilities    = noProc.capabilities & ~Capability::ProcFs;

    expect(IsSupportedBy(registry.resolve(ops::MonitorMemory, linux6), BackendId::Linux));
    expect(std::holds_alternative<Unsupported>(registry.resolve(ops::MonitorMemory, noProc)));

    PlatformProfile noSyslog = linux6;
    noSyslog.capabilities    = noSyslog.capabilities & ~Capability::Syslog;

    expect(IsSupportedBy(registry.resolve(ops::LogNative, linux6), BackendId::Posix));
    expect(registry.resolve(ops::LogNative, noSyslog) == Resolution(Fallback { FallbackPolicy::NoOp }));
  };

  "Unknown operations and platforms"_test = [&] -> void {
    const Resolution missing = registry.resolve("file.teleport", linux6);

    expect(std::holds_alternative<Unsupported>(missing));
    expect(std::get<Unsupported>(missing).reason.contains("file.teleport"));

    expect(std::holds_alternative<Unsupported>(registry.resolve(ops::FileOpen, unknown)));
    expect(std::holds_alternative<Unsupported>(registry.resolve(ops::FileFind, unknown)));
    expect(std::holds_alternative<Unsupported>(registry.resolve(ops::FileRemoveAll, unknown)));
    expect(std::holds_alternative<Unsupported>(registry.resolve(ops::FileCopy, unknown)));
  };

  "NoOp never applies to an unknown platform"_test = [&] -> void {
    const Resolution sync = registry.resolve(ops::FileSync, unknown);

    expect(std::holds_alternative<Unsupported>(sync));
    expect(std::holds_alternative<Unsupported>(registry.resolve(ops::LogNative, unknown)));

    PlatformProfile noSyslog = linux6;
    noSyslog.capabilities    = noSyslog.capabilities & ~Capability::Syslog;

    expect(registry.resolve(ops::LogNative, noSyslog) == Resolution(Fallback { FallbackPolicy::NoOp }));
  };

  "Emulation needs native prerequisites"_test = [] -> void {
    const CapabilityRegistry custom({
      CapabilityDescriptor {
        .operation = "demo.list",
        .entries   = { CapabilityEntry { .family = PlatformFamily::Linux, .major = None, .minor = None, .backend = BackendId::Posix } },
      },
      CapabilityDescriptor {
        .operation     = "demo.walk",
        .entries       = {},
        .fallback      = FallbackPolicy::Emulate,
        .note          = "built from demo.list",
        .prerequisites = { "demo.list" },
      },
      CapabilityDescriptor {
        .operation = "demo.free",
        .entries   = {},
        .fallback  = FallbackPolicy::Emulate,
      },
    });

    expect(custom.resolve("demo.walk", Profile(PlatformFamily::Linux, 6)) == Resolution(Fallback { FallbackPolicy::Emulate }));
    expect(std::holds_alternative<Unsupported>(custom.resolve("demo.walk", Profile(PlatformFamily::Windows, 10))));
    expect(std::get<Unsupported>(custom.resolve("demo.walk", Profile(PlatformFamily::Windows, 10))).reason.contains("demo.list"));

    // An emulation with no prerequisites is available everywhere, unknown platforms included.
    expect(custom.resolve("demo.free", Profile(PlatformFamily::Unknown, 0)) == Resolution(Fallback { FallbackPolicy::Emulate }));
  };

  "Resolution is deterministic"_test = [&] -> void {
    for (const StringView operation : registry.operations())
      for (const PlatformProfile* profile : { &linux6, &linux44, &windows, &mac, &haiku, &netbsd, &unknown })
        expect(registry.resolve(operation, *profile) == registry.resolve(operation, *profile)) << operation;
  };

  "Every operation name is registered"_test = [&] -> void {
    for (const StringView operation : { ops::FileOpen, ops::FileRemoveAll, ops::FileFind, ops::ProcessSpawn, ops::ProcessSignalCustom,
                                        ops::NetOptionSendBuffer, ops::LogNative, ops::MonitorIo })
      expect(registry.find(operation) != nullptr) << operation;
  };

  "Overrides replace the fallback policy"_test = [&] -> void {
    const Result<CapabilityRegistry> overridden = registry.withOverrides({ { String(ops::FileRemoveAll), FallbackPolicy::Error } });

    expect(overridden.has_value());
    if (!overridden)
      return;

    expect(std::holds_alternative<Unsupported>(overridden->resolve(ops::FileRemoveAll, windows)));
    expect(IsSupportedBy(overridden->resolve(ops::FileRemoveAll, linux6), BackendId::Posix));

    // The original is untouched.
    expect(registry.resolve(ops::FileRemoveAll, windows) == Resolution(Fallback { FallbackPolicy::Emulate }));
  };

  "Overrides naming unknown operations are rejected"_test = [&] -> void {
    const Result<CapabilityRegistry> overridden = registry.withOverrides({ { "file.teleport", FallbackPolicy::NoOp } });

    expect(!overridden.has_value());
    expect(!overridden && overridden.error().kind == conduit::utils::error::ErrorKind::InvalidArgument);
  };

  "Equally specific entries resolve in table order"_test = [] -> void {
    const CapabilityRegistry custom({
      CapabilityDescriptor {
        .operation = "demo.op",
        .entries   = {
          CapabilityEntry { .family = PlatformFamily::Linux, .major = None, .minor = None, .backend = BackendId::Linux },
          CapabilityEntry { .family = PlatformFamily::Linux, .major = None, .minor = None, .backend = BackendId::Posix },
          CapabilityEntry { .family = PlatformFamily::Linux, .major = 5, .minor = None, .backend = None },
        },
        .fallback = FallbackPolicy::NoOp,
      },
    });

    expect(IsSupportedBy(custom.resolve("demo.op", Profile(PlatformFamily::Linux, 6)), BackendId::Linux));
    expect(custom.resolve("demo.op", Profile(PlatformFamily::Linux, 5, 15)) == Resolution(Fallback { FallbackPolicy::NoOp }));
  };

  "Describe"_test = [] -> void {
    expect(Describe(Supported { BackendId::Darwin }) == String("Supported(Darwin)"));
    expect(Describe(Fallback { FallbackPolicy::Emulate }) == String("Fallback(Emulate)"));
    expect(Describe(Unsupported { "nope" }) == String("Unsupported(nope)"));
  };

  return 0;
}
