#include <boost/ut.hpp>

#include <Conduit++/Core/Context.hpp>
#include <Conduit++/Core/Dispatch.hpp>
#include <Conduit++/Core/Operations.hpp>

using namespace boost::ut;
using namespace conduit::utils::types;

using conduit::core::Context;
using conduit::core::Dispatch;
using conduit::core::Route;
using conduit::core::capability::BackendId;
using conduit::core::capability::CapabilityRegistry;
using conduit::core::capability::FallbackPolicy;
using conduit::core::platform::Classify;
using conduit::utils::error::ConduitError;
using conduit::utils::error::ErrorKind;

namespace ops = conduit::core::ops;

namespace {
  auto MakeContext(const StringView sysname, const StringView release, const Map<String, FallbackPolicy>& overrides = {}) -> UniquePointer<Context> {
    CapabilityRegistry registry = *CapabilityRegistry::withDefaults().withOverrides(overrides);

    return std::make_unique<Context>(Classify(sysname, release, "x86_64"), std::move(registry));
  }
} // namespace

auto main() -> int {
  const UniquePointer<Context> linux6  = MakeContext("Linux", "6.8.0");
  const UniquePointer<Context> windows = MakeContext("Windows_NT", "10.0.22631");
  const UniquePointer<Context> haiku   = MakeContext("Haiku", "1");

  "Supported operations run the native call with the resolved backend"_test = [&] -> void {
    Option<BackendId> seen;

    const Result<i32> result = Dispatch<i32>(*linux6, ops::FileCopy, {
      .native = [&](const BackendId backend) -> Result<i32> {
        seen = backend;
        return 7;
      },
      .emulate = [] -> Result<i32> { return -1; },
    });

    expect(result == 7);
    expect(seen == Some(BackendId::Linux));
  };

  "Native errors are returned verbatim"_test = [&] -> void {
    const Result<> result = Dispatch<void>(*windows, ops::FileRemove, {
      .native = [](BackendId) -> Result<> { return Err(ConduitError(ErrorKind::ResourceBusy, "locked", 32)); },
      .emulate = [] -> Result<> { return {}; },
    });

    expect(!result.has_value());
    expect(!result && result.error().kind == ErrorKind::ResourceBusy);
    expect(!result && result.error().nativeCode == Some(i64(32)));
  };

  "Emulate fallback runs the emulation"_test = [&] -> void {
    bool nativeCalled = false;

    const Result<u64> result = Dispatch<u64>(*windows, ops::FileRemoveAll, {
      .native  = [&](BackendId) -> Result<u64> { nativeCalled = true; return 0; },
      .emulate = [] -> Result<u64> { return 3; },
    });

    expect(result == u64(3));
    expect(!nativeCalled);
  };

  "Emulate fallback without an emulation is Unsupported"_test = [&] -> void {
    const Result<u64> result = Dispatch<u64>(*windows, ops::FileRemoveAll, {
      .native = [](BackendId) -> Result<u64> { return 0; },
    });

    expect(!result && result.error().kind == ErrorKind::Unsupported);
  };

  "NoOp fallback succeeds without running anything"_test = [&] -> void {
    const UniquePointer<Context> quiet = MakeContext("Linux", "6.8.0", { { String(ops::ProcessSignalCustom), FallbackPolicy::NoOp } });
    const UniquePointer<Context> win   = MakeContext("Windows_NT", "10.0", { { String(ops::ProcessSignalCustom), FallbackPolicy::NoOp } });

    bool ran = false;

    const Route<void> route {
      .native = [&](BackendId) -> Result<> { ran = true; return {}; },
    };

    expect(Dispatch<void>(*win, ops::ProcessSignalCustom, route).has_value());
    expect(!ran);

    // Linux has a native backend, so the override does not apply.
    expect(Dispatch<void>(*quiet, ops::ProcessSignalCustom, route).has_value());
    expect(ran);
  };

  "NoOp fallback uses the supplied result"_test = [&] -> void {
    const UniquePointer<Context> win = MakeContext("Windows_NT", "10.0", { { String(ops::ProcessSignalCustom), FallbackPolicy::NoOp } });

    const Result<i32> result = Dispatch<i32>(*win, ops::ProcessSignalCustom, {
      .native = [](BackendId) -> Result<i32> { return 1; },
      .noop   = [] -> Result<i32> { return 0; },
    });

    expect(result == 0);

    const Result<i32> missing = Dispatch<i32>(*win, ops::ProcessSignalCustom, {
      .native = [](BackendId) -> Result<i32> { return 1; },
    });

    expect(!missing && missing.error().kind == ErrorKind::Unsupported);
  };

  "Unsupported operations never reach the native call"_test = [&] -> void {
    bool ran = false;

    const Result<> result = Dispatch<void>(*haiku, ops::MonitorMemory, {
      .native = [&](BackendId) -> Result<> { ran = true; return {}; },
    });

    expect(!ran);
    expect(!result && result.error().kind == ErrorKind::Unsupported);
    expect(!result && result.error().message.contains(String(ops::MonitorMemory)));
  };

  "Unknown operations are Unsupported"_test = [&] -> void {
    const Result<> result = Dispatch<void>(*linux6, "file.teleport", {
      .native = [](BackendId) -> Result<> { return {}; },
    });

    expect(!result && result.error().kind == ErrorKind::Unsupported);
  };

  "Context::create applies overrides and rejects unknown operations"_test = [] -> void {
    conduit::config::Config config;
    config.fallbackPolicyOverrides.emplace(String(ops::FileRemoveAll), FallbackPolicy::Error);

    const Result<UniquePointer<Context>> ctx = Context::create(config);

    expect(ctx.has_value());

    config.fallbackPolicyOverrides.emplace("file.teleport", FallbackPolicy::NoOp);

    const Result<UniquePointer<Context>> rejected = Context::create(config);

    expect(!rejected && rejected.error().kind == ErrorKind::InvalidArgument);
  };

  return 0;
}
