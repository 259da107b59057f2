#include <boost/ut.hpp>

#include <cerrno>

#include <Conduit++/Utils/Error.hpp>

using namespace boost::ut;
using namespace conduit::utils::error;
using namespace conduit::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(ErrorKind::InvalidArgument, "fail");
  }

  auto succeed_helper() -> Result<i32> {
    return 42;
  }

  auto try_test_helper_fail() -> Result<i32> {
    i32 val = TRY(fail_helper());

    return val + 1; // Should not reach here
  }

  auto try_test_helper_success() -> Result<i32> {
    i32 val = TRY(succeed_helper());

    return val + 1; // Should be 43
  }

  auto errno_helper(const i32 err) -> Result<> {
    errno = err;
    ERR_ERRNO("open('{}')", "/nowhere");
  }
} // namespace

auto main() -> int {
  "ConduitError construction"_test = [] -> void {
    ConduitError err(ErrorKind::NotFound, "Item not found");

    expect(err.kind == ErrorKind::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
    expect(!err.nativeCode.has_value());
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
#ifdef _MSC_VER
    try {
      [[maybe_unused]] Result<i32> res = try_test_helper_fail();
      expect(false); // Should have thrown
    } catch (const ConduitError& e) {
      expect(e.kind == ErrorKind::InvalidArgument);
      expect(e.message == String("fail"));
    }
#else
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().kind == ErrorKind::InvalidArgument);
    expect(res.error().message == String("fail"));
#endif
  };

  "ERR macro"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR(ErrorKind::PlatformError, "native failure");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().kind == ErrorKind::PlatformError);
  };

  "ERR_FMT formats the message"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR_FMT(ErrorKind::Timeout, "waited {} ms for '{}'", 250, "child");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().kind == ErrorKind::Timeout);
    expect(res.error().message == String("waited 250 ms for 'child'"));
  };

  "ERR_ERRNO keeps the native code"_test = [] -> void {
    Result<> res = errno_helper(ENOENT);

    expect(!res.has_value());
    expect(res.error().kind == ErrorKind::NotFound);
    expect(res.error().nativeCode == Some(static_cast<i64>(ENOENT)));
    expect(res.error().message.starts_with("open('/nowhere')"));
  };

  "errno classification"_test = [] -> void {
    expect(ClassifyErrno(ENOENT) == ErrorKind::NotFound);
    expect(ClassifyErrno(ESRCH) == ErrorKind::NotFound);
    expect(ClassifyErrno(EACCES) == ErrorKind::PermissionDenied);
    expect(ClassifyErrno(EPERM) == ErrorKind::PermissionDenied);
    expect(ClassifyErrno(EBUSY) == ErrorKind::ResourceBusy);
    expect(ClassifyErrno(EADDRINUSE) == ErrorKind::ResourceBusy);
    expect(ClassifyErrno(ETIMEDOUT) == ErrorKind::Timeout);
    expect(ClassifyErrno(EINVAL) == ErrorKind::InvalidArgument);
    expect(ClassifyErrno(ENOTEMPTY) == ErrorKind::InvalidArgument);
    expect(ClassifyErrno(ENOSYS) == ErrorKind::Unsupported);
    expect(ClassifyErrno(EIO) == ErrorKind::PlatformError);
  };

  "KindName"_test = [] -> void {
    expect(KindName(ErrorKind::ResourceBusy) == StringView("ResourceBusy"));
    expect(KindName(ErrorKind::PlatformError) == StringView("PlatformError"));
  };

  "ConduitError formatter"_test = [] -> void {
    const ConduitError err(ErrorKind::PermissionDenied, "open('/root/x')");

    expect(std::format("{}", err) == String("PermissionDenied: open('/root/x')"));
  };

  return 0;
}
