#pragma once

#include <cerrno>                      // errno values
#include <cstring>                     // std::strerror
#include <format>                      // std::format, std::formatter
#include <magic_enum/magic_enum.hpp>   // magic_enum::enum_name
#include <matchit.hpp>                 // matchit::{match, is, or_, _}
#include <source_location>             // std::source_location

#ifdef _WIN32
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <winsock2.h> // WSA* error codes
  #include <windows.h>  // GetLastError, FormatMessageA
#endif

#include "Types.hpp"

namespace conduit::utils::error {
  /**
   * @enum ErrorKind
   * @brief Normalized error taxonomy shared by every adapter.
   *
   * Native failures are classified into one of these kinds before they reach a
   * caller. Anything that cannot be classified is reported as PlatformError and
   * keeps the native code for diagnostics.
   */
  enum class ErrorKind : types::u8 {
    Unsupported,      ///< Operation not available on this platform and no fallback is configured.
    ResourceBusy,     ///< Contention on a shared OS resource (locked file, port in use, would block).
    NotFound,         ///< Path, handle, process or peer does not exist.
    PermissionDenied, ///< The caller lacks the rights to perform the operation.
    Timeout,          ///< A caller-supplied timeout elapsed.
    InvalidArgument,  ///< A caller-supplied value violates the abstract contract.
    PlatformError,    ///< Unexpected native failure; see ConduitError::nativeCode.
  };

  /**
   * @struct ConduitError
   * @brief Error payload carried by every failed Result.
   */
  struct ConduitError {
    types::String        message;    ///< Human readable description, including native detail where known.
    std::source_location location;   ///< Where the error was raised.
    ErrorKind            kind;       ///< Normalized category.
    types::Option<types::i64> nativeCode; ///< errno / GetLastError / WSAGetLastError, when one exists.

    ConduitError(const ErrorKind kind, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), kind(kind) {}

    ConduitError(const ErrorKind kind, types::String msg, const types::i64 native, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), kind(kind), nativeCode(native) {}
  };

  /**
   * @brief Returns the enumerator name of an ErrorKind ("NotFound", "Timeout", ...).
   */
  [[nodiscard]] constexpr auto KindName(const ErrorKind kind) -> types::StringView {
    return magic_enum::enum_name(kind);
  }

  /**
   * @brief Classifies a POSIX errno value.
   */
  [[nodiscard]] inline auto ClassifyErrno(const types::i32 err) -> ErrorKind {
    using namespace matchit;
    using enum ErrorKind;

    return match(err)(
      is | or_(ENOENT, ENOTDIR, ESRCH, ECHILD, ECONNREFUSED, EHOSTUNREACH, ENETUNREACH) = NotFound,
      is | or_(EACCES, EPERM, EROFS)                                                  = PermissionDenied,
      is | or_(EBUSY, ETXTBSY, EAGAIN, EWOULDBLOCK, EADDRINUSE, EDEADLK, ENOLCK)       = ResourceBusy,
      is | or_(ETIMEDOUT)                                                             = Timeout,
      is | or_(EINVAL, ENAMETOOLONG, EBADF, EEXIST, ENOTEMPTY, EISDIR, EDOM, ERANGE)   = InvalidArgument,
      is | or_(ENOSYS, ENOTSUP, EOPNOTSUPP, EAFNOSUPPORT, EPROTONOSUPPORT, ENOPROTOOPT) = Unsupported,
      is | _                                                                          = PlatformError
    );
  }

  /**
   * @brief Builds a ConduitError from an errno value and a context message.
   * @param err   The errno value captured right after the failing call.
   * @param what  What was being attempted, e.g. "open('/tmp/x')".
   */
  [[nodiscard]] inline auto FromErrno(const types::i32 err, const types::StringView what, const std::source_location& loc = std::source_location::current()) -> ConduitError {
    return { ClassifyErrno(err), std::format("{}: {} (errno {})", what, std::strerror(err), err), static_cast<types::i64>(err), loc };
  }

#ifdef _WIN32
  /**
   * @brief Classifies a Win32 or Winsock error code.
   */
  [[nodiscard]] inline auto ClassifyWin32(const types::u32 code) -> ErrorKind {
    using namespace matchit;
    using enum ErrorKind;

    const auto value = static_cast<types::i64>(code);

    // clang-format off
    return match(value)(
      is | or_(ERROR_FILE_NOT_FOUND, ERROR_PATH_NOT_FOUND, ERROR_INVALID_DRIVE, ERROR_BAD_NETPATH, ERROR_MOD_NOT_FOUND,
               WSAECONNREFUSED, WSAEHOSTUNREACH, WSAENETUNREACH, WSAHOST_NOT_FOUND, WSANO_DATA)      = NotFound,
      is | or_(ERROR_ACCESS_DENIED, ERROR_PRIVILEGE_NOT_HELD, ERROR_WRITE_PROTECT, WSAEACCES)        = PermissionDenied,
      is | or_(ERROR_SHARING_VIOLATION, ERROR_LOCK_VIOLATION, ERROR_BUSY, ERROR_PIPE_BUSY,
               WSAEADDRINUSE, WSAEWOULDBLOCK)                                                       = ResourceBusy,
      is | or_(ERROR_TIMEOUT, WAIT_TIMEOUT, WSAETIMEDOUT)                                           = Timeout,
      is | or_(ERROR_INVALID_PARAMETER, ERROR_INVALID_NAME, ERROR_FILE_EXISTS, ERROR_ALREADY_EXISTS,
               ERROR_DIR_NOT_EMPTY, ERROR_FILENAME_EXCED_RANGE, ERROR_INVALID_HANDLE, WSAEINVAL, WSAENOTSOCK) = InvalidArgument,
      is | or_(ERROR_NOT_SUPPORTED, ERROR_CALL_NOT_IMPLEMENTED, WSAENOPROTOOPT, WSAEOPNOTSUPP,
               WSAEAFNOSUPPORT, WSAEPROTONOSUPPORT)                                                 = Unsupported,
      is | _                                                                                        = PlatformError
    );
    // clang-format on
  }

  /**
   * @brief Builds a ConduitError from a GetLastError() / WSAGetLastError() value.
   */
  [[nodiscard]] inline auto FromWin32(const types::u32 code, const types::StringView what, const std::source_location& loc = std::source_location::current()) -> ConduitError {
    types::Array<char, 512> buffer {};

    DWORD len = FormatMessageA(
      FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
      nullptr,
      code,
      MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
      buffer.data(),
      static_cast<DWORD>(buffer.size()),
      nullptr
    );

    while (len > 0 && (buffer.at(len - 1) == '\r' || buffer.at(len - 1) == '\n' || buffer.at(len - 1) == ' '))
      --len;

    return { ClassifyWin32(code), std::format("{}: {} (error {})", what, types::StringView(buffer.data(), len), code), static_cast<types::i64>(code), loc };
  }
#endif
} // namespace conduit::utils::error

template <>
struct std::formatter<conduit::utils::error::ConduitError> : std::formatter<std::string_view> {
  auto format(const conduit::utils::error::ConduitError& err, std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{}: {}", conduit::utils::error::KindName(err.kind), err.message);
  }
};

#define ERR(kind, msg)          return ::conduit::utils::types::Err(::conduit::utils::error::ConduitError(kind, msg))
#define ERR_FROM(err)           return ::conduit::utils::types::Err(::conduit::utils::error::ConduitError(err))
#define ERR_FMT(kind, fmt, ...) return ::conduit::utils::types::Err(::conduit::utils::error::ConduitError(kind, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Returns the current errno, classified, from the enclosing function.
 *
 * errno is captured before the message is formatted so that allocation inside
 * std::format cannot clobber it.
 *
 * @code
 * if (::rename(from, to) == -1)
 *   ERR_ERRNO("rename('{}', '{}')", from, to);
 * @endcode
 */
#define ERR_ERRNO(fmt, ...)                                                                                            \
  do {                                                                                                                 \
    const ::conduit::utils::types::i32 _conduit_errno = errno;                                                         \
    return ::conduit::utils::types::Err(                                                                               \
      ::conduit::utils::error::FromErrno(_conduit_errno, std::format(fmt __VA_OPT__(, ) __VA_ARGS__))                  \
    );                                                                                                                 \
  } while (0)

#ifdef _WIN32
  /**
   * @brief Returns GetLastError(), classified, from the enclosing function.
   */
  #define ERR_WIN32(fmt, ...)                                                                                          \
    do {                                                                                                               \
      const DWORD _conduit_last_error = GetLastError();                                                                \
      return ::conduit::utils::types::Err(                                                                             \
        ::conduit::utils::error::FromWin32(_conduit_last_error, std::format(fmt __VA_OPT__(, ) __VA_ARGS__))           \
      );                                                                                                               \
    } while (0)
#endif

/**
 * @brief Rust-style error propagation.
 *
 * Evaluates an expression returning Result<T>. On error, returns that error from
 * the enclosing function; otherwise yields the unwrapped value.
 *
 * @code
 * auto readConfig(FileSystem& fs) -> Result<String> {
 *   File   file = TRY(fs.open("conduit.toml", OpenMode::Read));
 *   Bytes  data = TRY(file.readAll());
 *   return String(data.begin(), data.end());
 * }
 * @endcode
 *
 * @note GCC/Clang use statement expressions; MSVC falls back to a throwing lambda.
 */
#ifdef _MSC_VER
  #define CONDUIT_CONCAT_IMPL(a, b) a##b
  #define CONDUIT_CONCAT(a, b)      CONDUIT_CONCAT_IMPL(a, b)

  #define TRY(expr)            \
    [&]() {                    \
      auto _tmp = (expr);      \
      if (!_tmp)               \
        throw _tmp.error();    \
      return *std::move(_tmp); \
    }()

  #define TRY_RESULT(var, expr)                                                                   \
    auto CONDUIT_CONCAT(_conduit_try_result_, __LINE__) = (expr);                                 \
    if (!CONDUIT_CONCAT(_conduit_try_result_, __LINE__))                                          \
      return ::conduit::utils::types::Err(CONDUIT_CONCAT(_conduit_try_result_, __LINE__).error()); \
    (var) = std::move(*CONDUIT_CONCAT(_conduit_try_result_, __LINE__))

  #define TRY_VOID(expr)                                                 \
    do {                                                                 \
      auto&& _conduit_try_result = (expr);                               \
      if (!_conduit_try_result)                                          \
        return ::conduit::utils::types::Err(_conduit_try_result.error()); \
    } while (0)
#else
  #define TRY(expr)                                                                             \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _conduit_try_result = (expr);                                                    \
        if (!_conduit_try_result)                                                               \
          return ::conduit::utils::types::Err(_conduit_try_result.error());                     \
        std::move(*_conduit_try_result);                                                        \
      })                                                                                        \
        _Pragma("clang diagnostic pop")

  #define TRY_VOID(expr)                                                                        \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _conduit_try_result = (expr);                                                    \
        if (!_conduit_try_result)                                                               \
          return ::conduit::utils::types::Err(_conduit_try_result.error());                     \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif
