#pragma once

#ifdef _WIN32

  #include "Files/FileBackend.hpp"
  #include "Network/SocketBackend.hpp"
  #include "Process/ProcessBackend.hpp"
  #include "Telemetry/TelemetryBackend.hpp"

namespace conduit::os::windows {
  namespace types = ::conduit::utils::types;

  /**
   * @brief Converts UTF-8 to the UTF-16 the W-suffixed Win32 calls take.
   */
  auto ToWide(types::StringView text) -> types::Result<types::WString>;

  auto ToUtf8(types::WStringView text) -> types::Result<types::String>;

  class WindowsFileBackend final : public files::FileBackend {
   public:
    auto open(const types::String& path, files::OpenMode mode) -> types::Result<files::NativeFile> override;
    auto read(files::NativeFile file, types::Span<types::u8> buffer) -> types::Result<types::usize> override;
    auto write(files::NativeFile file, types::Span<const types::u8> data) -> types::Result<types::usize> override;
    auto seek(files::NativeFile file, types::i64 offset, files::SeekOrigin origin) -> types::Result<types::u64> override;
    auto sync(files::NativeFile file) -> types::Result<> override;
    auto close(files::NativeFile file) -> types::Result<> override;
    auto stat(const types::String& path, bool followLinks) -> types::Result<files::FileStat> override;
    auto list(const types::String& path) -> types::Result<types::Vec<files::DirEntry>> override;
    auto remove(const types::String& path) -> types::Result<> override;
    auto createDirectory(const types::String& path) -> types::Result<> override;
    auto rename(const types::String& from, const types::String& to) -> types::Result<> override;
    auto setPermissions(const types::String& path, files::Permissions permissions) -> types::Result<> override;
    auto copy(const types::String& from, const types::String& to, bool overwrite) -> types::Result<types::u64> override;
  };

  /**
   * @brief CreateProcessW-based spawning.
   *
   * Every child gets its own process group so that Interrupt can be delivered
   * as CTRL_BREAK_EVENT without also reaching the caller's console.
   */
  class WindowsProcessBackend final : public process::ProcessBackend {
   public:
    auto spawn(const process::SpawnRequest& request) -> types::Result<process::NativeProcess> override;
    auto poll(process::NativeProcess& process) -> types::Result<types::Option<process::ExitStatus>> override;
    auto wait(process::NativeProcess& process) -> types::Result<process::ExitStatus> override;
    auto signal(process::NativeProcess& process, process::Signal signal) -> types::Result<> override;
    auto readOutput(process::NativeProcess& process, types::Option<types::Millis> timeout)
      -> types::Result<types::Pair<types::String, types::String>> override;
    auto readPipe(types::isize pipe) -> types::Result<types::String> override;
    auto release(process::NativeProcess& process) -> types::Result<> override;
  };

  class WindowsSocketBackend final : public network::SocketBackend {
   public:
    auto connect(const network::Address& address, network::Protocol protocol, types::Option<types::Millis> timeout)
      -> types::Result<network::NativeSocket> override;
    auto listen(const network::Address& address, types::i32 backlog) -> types::Result<types::Pair<network::NativeSocket, types::u16>> override;
    auto accept(network::NativeSocket listener, types::Option<types::Millis> timeout)
      -> types::Result<types::Pair<network::NativeSocket, network::Address>> override;
    auto send(network::NativeSocket socket, types::Span<const types::u8> data) -> types::Result<types::usize> override;
    auto receive(network::NativeSocket socket, types::Span<types::u8> buffer, types::Option<types::Millis> timeout)
      -> types::Result<types::usize> override;
    auto setOption(network::NativeSocket socket, network::SocketOption option, const network::OptionValue& value) -> types::Result<> override;
    auto close(network::NativeSocket socket) -> types::Result<> override;
  };

  class WindowsTelemetryBackend final : public telemetry::TelemetryBackend {
   public:
    auto cpuTime() -> types::Result<types::f64> override;
    auto memory() -> types::Result<telemetry::MemoryUsage> override;
    auto systemMemoryUsed() -> types::Result<types::u64> override;
    auto io() -> types::Result<telemetry::IoCounters> override;
  };

  class EventLogBackend final : public telemetry::NativeLogBackend {
   public:
    auto open(const types::String& ident) -> types::Result<types::isize> override;
    auto write(types::isize handle, utils::logging::LogLevel level, types::StringView text) -> types::Result<> override;
    auto close(types::isize handle) -> types::Result<> override;
  };
} // namespace conduit::os::windows

#endif // _WIN32
