#if !defined(_WIN32)

  #include <sys/resource.h> // getrusage, rusage, RUSAGE_SELF
  #include <syslog.h>       // openlog, syslog, closelog, LOG_*

  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Logging.hpp>

  #include "OS/Posix/Posix.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::utils::logging::LogLevel;

namespace {
  auto Seconds(const timeval& value) -> f64 {
    return static_cast<f64>(value.tv_sec) + (static_cast<f64>(value.tv_usec) / 1'000'000.0);
  }

  auto SyslogPriority(const LogLevel level) -> int {
    switch (level) {
      case LogLevel::Trace:
      case LogLevel::Debug: return LOG_DEBUG;
      case LogLevel::Info:  return LOG_INFO;
      case LogLevel::Warn:  return LOG_WARNING;
      case LogLevel::Error: return LOG_ERR;
    }

    return LOG_NOTICE;
  }

  // openlog(3) keeps one identity per process.
  constexpr isize SyslogHandle = 0;
} // namespace

namespace conduit::os::posix {
  auto PosixTelemetryBackend::cpuTime() -> Result<f64> {
    rusage usage {};

    if (::getrusage(RUSAGE_SELF, &usage) == -1)
      ERR_ERRNO("getrusage");

    return Seconds(usage.ru_utime) + Seconds(usage.ru_stime);
  }

  auto SyslogBackend::open(const String& ident) -> Result<isize> {
    ::openlog(ident.c_str(), LOG_PID | LOG_NDELAY, LOG_USER);
    return SyslogHandle;
  }

  auto SyslogBackend::write(const isize handle, const LogLevel level, const StringView text) -> Result<> {
    if (handle != SyslogHandle)
      ERR_FMT(InvalidArgument, "Unknown syslog handle {}", handle);

    ::syslog(SyslogPriority(level), "%.*s", static_cast<int>(text.size()), text.data());
    return {};
  }

  auto SyslogBackend::close(const isize handle) -> Result<> {
    if (handle != SyslogHandle)
      ERR_FMT(InvalidArgument, "Unknown syslog handle {}", handle);

    ::closelog();
    return {};
  }
} // namespace conduit::os::posix

#endif // !defined(_WIN32)
