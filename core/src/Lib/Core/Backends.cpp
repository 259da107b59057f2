/**
 * @file Backends.cpp
 * @brief Lookup from BackendId to the backend instances compiled into this build.
 *
 * Backends are stateless apart from the handles they return, so each one is a
 * single function-local static shared by every Context.
 */

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Conduit++/Utils/Error.hpp>

#include "Files/FileBackend.hpp"
#include "Network/SocketBackend.hpp"
#include "Process/ProcessBackend.hpp"
#include "Telemetry/TelemetryBackend.hpp"

#ifdef _WIN32
  #include "OS/Windows.hpp"
#else
  #include "OS/Posix/Posix.hpp"
#endif

#ifdef __linux__
  #include "OS/Linux.hpp"
#elif defined(__APPLE__)
  #include "OS/macOS.hpp"
#endif

using namespace conduit::utils::types;
using conduit::core::capability::BackendId;
using conduit::utils::error::ErrorKind;

namespace {
  template <typename T>
  auto Missing(const BackendId id, const StringView what) -> Result<T*> {
    ERR_FMT(ErrorKind::Unsupported, "The {} {} backend is not part of this build", magic_enum::enum_name(id), what);
  }

  template <typename T>
  auto Instance() -> T* {
    static T Backend;
    return &Backend;
  }
} // namespace

namespace conduit::files {
  auto GetFileBackend(const BackendId id) -> Result<FileBackend*> {
    switch (id) {
#ifdef _WIN32
      case BackendId::Windows: return Instance<os::windows::WindowsFileBackend>();
#else
      case BackendId::Posix: return Instance<os::posix::PosixFileBackend>();
#endif
#ifdef __linux__
      case BackendId::Linux: return Instance<os::linux_os::LinuxFileBackend>();
#elif defined(__APPLE__)
      case BackendId::Darwin: return Instance<os::darwin::DarwinFileBackend>();
#endif
      default: return Missing<FileBackend>(id, "file");
    }
  }
} // namespace conduit::files

namespace conduit::process {
  auto GetProcessBackend(const BackendId id) -> Result<ProcessBackend*> {
    switch (id) {
#ifdef _WIN32
      case BackendId::Windows: return Instance<os::windows::WindowsProcessBackend>();
#else
      case BackendId::Posix: return Instance<os::posix::PosixProcessBackend>();
#endif
      default: return Missing<ProcessBackend>(id, "process");
    }
  }
} // namespace conduit::process

namespace conduit::network {
  auto GetSocketBackend(const BackendId id) -> Result<SocketBackend*> {
    switch (id) {
#ifdef _WIN32
      case BackendId::Windows: return Instance<os::windows::WindowsSocketBackend>();
#else
      case BackendId::Posix: return Instance<os::posix::PosixSocketBackend>();
#endif
      default: return Missing<SocketBackend>(id, "socket");
    }
  }
} // namespace conduit::network

namespace conduit::telemetry {
  auto GetTelemetryBackend(const BackendId id) -> Result<TelemetryBackend*> {
    switch (id) {
#ifdef _WIN32
      case BackendId::Windows: return Instance<os::windows::WindowsTelemetryBackend>();
#else
      case BackendId::Posix: return Instance<os::posix::PosixTelemetryBackend>();
#endif
#ifdef __linux__
      case BackendId::Linux: return Instance<os::linux_os::LinuxTelemetryBackend>();
#elif defined(__APPLE__)
      case BackendId::Darwin: return Instance<os::darwin::DarwinTelemetryBackend>();
#endif
      default: return Missing<TelemetryBackend>(id, "telemetry");
    }
  }

  auto GetNativeLogBackend(const BackendId id) -> Result<NativeLogBackend*> {
    switch (id) {
#ifdef _WIN32
      case BackendId::Windows: return Instance<os::windows::EventLogBackend>();
#else
      case BackendId::Posix: return Instance<os::posix::SyslogBackend>();
#endif
      default: return Missing<NativeLogBackend>(id, "native log");
    }
  }
} // namespace conduit::telemetry
