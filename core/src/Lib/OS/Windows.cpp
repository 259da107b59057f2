/**
 * @file   Windows.cpp
 * @brief  Win32 and Winsock backends, plus host identity for Windows.
 *
 * @details Every path and string handed to the OS goes through the W-suffixed
 * APIs, so logical UTF-8 paths are converted at this boundary and nowhere else.
 * The backends cover:
 * - Files through CreateFileW and the FindFirstFileW family
 * - Processes through CreateProcessW with anonymous pipes
 * - Sockets through Winsock 2 (initialized once per process)
 * - Telemetry through GetProcessTimes, psapi and GetProcessIoCounters
 * - The Windows Event Log as the native log
 */

#ifdef _WIN32

  #include <algorithm> // std::ranges::{sort, transform}
  #include <cctype>    // std::tolower
  #include <chrono>    // std::chrono::steady_clock
  #include <climits>   // INT_MAX
  #include <format>    // std::format
  #include <memory>    // std::unique_ptr
  #include <tuple>     // std::tie
  #include <utility>   // std::exchange

  // winsock2.h must come before windows.h.
  #include <winsock2.h> // WSAStartup, WSAPoll, socket, ...
  #include <ws2tcpip.h> // getaddrinfo, getnameinfo

  #include <windows.h> // CreateFileW, CreateProcessW, RTL_OSVERSIONINFOW, ...

  #include <psapi.h> // GetProcessMemoryInfo, PROCESS_MEMORY_COUNTERS_EX

  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Logging.hpp>
  #include <Conduit++/Utils/Types.hpp>

  #include "Core/Host.hpp"
  #include "OS/Windows.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::utils::error::ConduitError;
using conduit::utils::error::FromWin32;
using conduit::utils::logging::LogLevel;

namespace files   = conduit::files;
namespace network = conduit::network;
namespace process = conduit::process;

namespace {
  using Clock = std::chrono::steady_clock;

  constexpr usize ReadChunk = 4096;

  // STATUS_CONTROL_C_EXIT: the default handler's exit code after CTRL_C/CTRL_BREAK.
  constexpr DWORD ControlExitCode = 0xC000013A;

  constexpr i32 SigInt  = 2;
  constexpr i32 SigKill = 9;
  constexpr i32 SigTerm = 15;

  auto ToHandle(const isize value) -> HANDLE {
    return reinterpret_cast<HANDLE>(value); // NOLINT(*-pro-type-reinterpret-cast, performance-no-int-to-ptr)
  }

  auto FromHandle(HANDLE handle) -> isize {
    return reinterpret_cast<isize>(handle); // NOLINT(*-pro-type-reinterpret-cast)
  }

  auto ToSocket(const network::NativeSocket value) -> SOCKET {
    return static_cast<SOCKET>(value);
  }

  auto WsaError(const StringView what) -> ConduitError {
    return FromWin32(static_cast<u32>(WSAGetLastError()), what);
  }

  // RAII wrapper for Windows handles
  class HandleGuard {
    HANDLE m_handle = nullptr;

   public:
    HandleGuard() = default;

    explicit HandleGuard(HANDLE handle) : m_handle(handle) {}

    ~HandleGuard() {
      if (m_handle && m_handle != INVALID_HANDLE_VALUE)
        CloseHandle(m_handle);
    }

    HandleGuard(const HandleGuard&)                    = delete;
    auto operator=(const HandleGuard&) -> HandleGuard& = delete;

    HandleGuard(HandleGuard&& other) noexcept : m_handle(std::exchange(other.m_handle, nullptr)) {}

    auto operator=(HandleGuard&& other) noexcept -> HandleGuard& {
      if (this != &other) {
        if (m_handle && m_handle != INVALID_HANDLE_VALUE)
          CloseHandle(m_handle);
        m_handle = std::exchange(other.m_handle, nullptr);
      }
      return *this;
    }

    [[nodiscard]] auto get() const -> HANDLE {
      return m_handle;
    }

    [[nodiscard]] auto release() -> HANDLE {
      return std::exchange(m_handle, nullptr);
    }

    [[nodiscard]] explicit operator bool() const {
      return m_handle != nullptr && m_handle != INVALID_HANDLE_VALUE;
    }
  };

  /**
   * @brief WSAStartup/WSACleanup for the lifetime of the process.
   */
  class WinsockSession {
   public:
    static auto require() -> Result<> {
      static const WinsockSession Session;

      if (Session.m_status != 0)
        return Err(FromWin32(static_cast<u32>(Session.m_status), "WSAStartup"));

      return {};
    }

    WinsockSession(const WinsockSession&)                    = delete;
    WinsockSession(WinsockSession&&)                         = delete;
    auto operator=(const WinsockSession&) -> WinsockSession& = delete;
    auto operator=(WinsockSession&&) -> WinsockSession&      = delete;

   private:
    WinsockSession() {
      WSADATA data {};
      m_status = WSAStartup(MAKEWORD(2, 2), &data);
    }

    ~WinsockSession() {
      if (m_status == 0)
        WSACleanup();
    }

    int m_status = 0;
  };

  auto FileTimeToTimestamp(const FILETIME& time) -> Timestamp {
    // FILETIME counts 100ns ticks since 1601-01-01.
    constexpr u64 EpochDifference = 116'444'736'000'000'000ULL;

    const u64 ticks = (static_cast<u64>(time.dwHighDateTime) << 32) | time.dwLowDateTime;
    const i64 since = static_cast<i64>(ticks) - static_cast<i64>(EpochDifference);

    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(since * 100)));
  }

  auto IsExecutableName(const StringView path) -> bool {
    const usize dot = path.rfind('.');

    if (dot == StringView::npos)
      return false;

    String ext(path.substr(dot));
    std::ranges::transform(ext, ext.begin(), [](const char chr) -> char { return static_cast<char>(std::tolower(static_cast<unsigned char>(chr))); });

    return ext == ".exe" || ext == ".com" || ext == ".bat" || ext == ".cmd";
  }

  auto TypeOf(const DWORD attributes) -> files::EntryType {
    if (attributes & FILE_ATTRIBUTE_REPARSE_POINT)
      return files::EntryType::Symlink;
    if (attributes & FILE_ATTRIBUTE_DIRECTORY)
      return files::EntryType::Directory;
    if (attributes & FILE_ATTRIBUTE_DEVICE)
      return files::EntryType::Other;

    return files::EntryType::File;
  }

  auto ToFileStat(const StringView path, const DWORD attributes, const DWORD sizeHigh, const DWORD sizeLow, const FILETIME& modified) -> files::FileStat {
    return {
      .size        = (static_cast<u64>(sizeHigh) << 32) | sizeLow,
      .modified    = FileTimeToTimestamp(modified),
      .permissions = {
        .readable   = true,
        .writable   = (attributes & FILE_ATTRIBUTE_READONLY) == 0,
        .executable = (attributes & FILE_ATTRIBUTE_DIRECTORY) == 0 && IsExecutableName(path),
      },
      .type        = TypeOf(attributes),
      .identity    = None,
    };
  }

  /**
   * @brief Quotes one argument the way CommandLineToArgvW and the MSVC runtime split it.
   */
  auto QuoteArgument(const StringView arg) -> String {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == StringView::npos)
      return String(arg);

    String quoted = "\"";

    for (usize i = 0; i < arg.size(); ++i) {
      usize backslashes = 0;

      while (i < arg.size() && arg[i] == '\\') {
        ++backslashes;
        ++i;
      }

      if (i == arg.size()) {
        quoted.append(backslashes * 2, '\\');
        break;
      }

      if (arg[i] == '"') {
        quoted.append((backslashes * 2) + 1, '\\');
        quoted += '"';
      } else {
        quoted.append(backslashes, '\\');
        quoted += arg[i];
      }
    }

    quoted += '"';
    return quoted;
  }

  auto DecodeExit(const process::NativeProcess& native, const DWORD code) -> process::ExitStatus {
    using process::Signal;
    using process::SignalKind;

    process::ExitStatus status { .code = static_cast<i32>(code), .terminatedBySignal = None };

    if (native.sentSignal && native.sentSignal->kind != SignalKind::Interrupt)
      status.terminatedBySignal = native.sentSignal;
    else if (code == ControlExitCode)
      status.terminatedBySignal = Signal::interrupt();

    if (status.terminatedBySignal) {
      switch (status.terminatedBySignal->kind) {
        case SignalKind::Terminate: status.code = 128 + SigTerm; break;
        case SignalKind::Kill:      status.code = 128 + SigKill; break;
        case SignalKind::Interrupt: status.code = 128 + SigInt; break;
        case SignalKind::Custom:    break;
      }
    }

    return status;
  }

  auto MakePipe() -> Result<Pair<HandleGuard, HandleGuard>> {
    SECURITY_ATTRIBUTES attributes { .nLength = sizeof(SECURITY_ATTRIBUTES), .lpSecurityDescriptor = nullptr, .bInheritHandle = TRUE };

    HANDLE readEnd  = nullptr;
    HANDLE writeEnd = nullptr;

    if (!CreatePipe(&readEnd, &writeEnd, &attributes, 0))
      ERR_WIN32("CreatePipe");

    HandleGuard reader(readEnd);
    HandleGuard writer(writeEnd);

    // Only the child's end is inherited.
    if (!SetHandleInformation(reader.get(), HANDLE_FLAG_INHERIT, 0))
      ERR_WIN32("SetHandleInformation");

    return Pair(std::move(reader), std::move(writer));
  }

  /**
   * @brief Reads what is available without blocking.
   * @return False once the writer has closed its end.
   */
  auto DrainAvailable(HANDLE pipe, String& out, bool& progressed) -> Result<bool> {
    DWORD available = 0;

    if (!PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr)) {
      if (GetLastError() == ERROR_BROKEN_PIPE)
        return false;

      ERR_WIN32("PeekNamedPipe");
    }

    if (available == 0)
      return true;

    Array<char, ReadChunk> buffer {};
    DWORD                  got = 0;

    if (!ReadFile(pipe, buffer.data(), std::min<DWORD>(available, static_cast<DWORD>(buffer.size())), &got, nullptr)) {
      if (GetLastError() == ERROR_BROKEN_PIPE)
        return false;

      ERR_WIN32("ReadFile(pipe)");
    }

    out.append(buffer.data(), got);
    progressed = progressed || got > 0;
    return true;
  }

  auto Resolve(const network::Address& address, const network::Protocol protocol, const bool passive) -> Result<addrinfo*> {
    TRY_VOID(WinsockSession::require());

    addrinfo hints {};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = protocol == network::Protocol::Tcp ? SOCK_STREAM : SOCK_DGRAM;
    hints.ai_flags    = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

    const String service = std::to_string(address.port);
    addrinfo*    found   = nullptr;

    if (getaddrinfo(address.host.empty() ? nullptr : address.host.c_str(), service.c_str(), &hints, &found) != 0)
      return Err(WsaError(std::format("getaddrinfo('{}')", address.host)));

    return found;
  }

  auto PeerOf(const sockaddr_storage& storage, const int len) -> network::Address {
    Array<char, NI_MAXHOST> host {};
    Array<char, NI_MAXSERV> service {};

    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    if (getnameinfo(reinterpret_cast<const sockaddr*>(&storage), len, host.data(), static_cast<DWORD>(host.size()), service.data(), static_cast<DWORD>(service.size()), NI_NUMERICHOST | NI_NUMERICSERV) != 0)
      return {};

    return { .host = String(host.data()), .port = static_cast<u16>(std::stoul(service.data())) };
  }

  auto WaitReadable(const SOCKET sock, const short events, const Millis timeout) -> Result<bool> {
    WSAPOLLFD pfd { .fd = sock, .events = events, .revents = 0 };

    const int ready = WSAPoll(&pfd, 1, static_cast<INT>(timeout.count()));

    if (ready == SOCKET_ERROR)
      return Err(WsaError("WSAPoll"));

    return ready > 0;
  }

  auto SetIntOption(const SOCKET sock, const int name, const int value, const StringView label) -> Result<> {
    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    if (setsockopt(sock, SOL_SOCKET, name, reinterpret_cast<const char*>(&value), sizeof(value)) == SOCKET_ERROR)
      return Err(WsaError(std::format("setsockopt({})", label)));

    return {};
  }

  auto EventType(const LogLevel level) -> WORD {
    switch (level) {
      case LogLevel::Trace:
      case LogLevel::Debug:
      case LogLevel::Info:  return EVENTLOG_INFORMATION_TYPE;
      case LogLevel::Warn:  return EVENTLOG_WARNING_TYPE;
      case LogLevel::Error: return EVENTLOG_ERROR_TYPE;
    }

    return EVENTLOG_INFORMATION_TYPE;
  }

  auto MachineName(const WORD architecture) -> StringView {
    switch (architecture) {
      case PROCESSOR_ARCHITECTURE_AMD64: return "AMD64";
      case PROCESSOR_ARCHITECTURE_ARM64: return "ARM64";
      case PROCESSOR_ARCHITECTURE_INTEL: return "x86";
      case PROCESSOR_ARCHITECTURE_ARM:   return "arm";
      default:                           return "";
    }
  }
} // namespace

namespace conduit::core::host {
  auto QueryHostIdentity() -> HostIdentity {
    using RtlGetVersionFn = LONG(WINAPI*)(PRTL_OSVERSIONINFOW);

    HostIdentity identity { .sysname = "Windows_NT", .release = {}, .machine = {} };

    SYSTEM_INFO system {};
    GetNativeSystemInfo(&system);
    identity.machine = String(MachineName(system.wProcessorArchitecture));

    // GetVersionEx lies to unmanifested processes; ntdll does not.
    HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");

    if (ntdll == nullptr) {
      debug_log("ntdll.dll is not loaded; version unknown");
      return identity;
    }

    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    const auto rtlGetVersion = reinterpret_cast<RtlGetVersionFn>(GetProcAddress(ntdll, "RtlGetVersion"));

    if (rtlGetVersion == nullptr) {
      debug_log("RtlGetVersion is unavailable; version unknown");
      return identity;
    }

    RTL_OSVERSIONINFOW version {};
    version.dwOSVersionInfoSize = sizeof(version);

    if (rtlGetVersion(&version) == 0)
      identity.release = std::format("{}.{}.{}", version.dwMajorVersion, version.dwMinorVersion, version.dwBuildNumber);

    return identity;
  }

  auto ProbeCapabilities(const platform::PlatformProfile& classified) -> platform::Capability {
    platform::Capability caps = classified.capabilities;

    // Unprivileged symlinks need Developer Mode (build 14972+).
    HKEY  key   = nullptr;
    DWORD allow = 0;
    DWORD size  = sizeof(allow);

    if (RegOpenKeyExW(HKEY_LOCAL_MACHINE, L"SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\AppModelUnlock", 0, KEY_READ, &key) == ERROR_SUCCESS) {
      // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
      if (RegQueryValueExW(key, L"AllowDevelopmentWithoutDevLicense", nullptr, nullptr, reinterpret_cast<LPBYTE>(&allow), &size) == ERROR_SUCCESS && allow == 1)
        caps |= platform::Capability::Symlinks;

      RegCloseKey(key);
    }

    return caps;
  }
} // namespace conduit::core::host

namespace conduit::os::windows {
  // ─────────────────────────────────────────────────────────────────────────────
  // Strings
  // ─────────────────────────────────────────────────────────────────────────────

  auto ToWide(const StringView text) -> Result<WString> {
    if (text.empty())
      return WString {};

    const i32 sizeNeeded = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, text.data(), static_cast<i32>(text.size()), nullptr, 0);

    if (sizeNeeded == 0)
      ERR_WIN32("MultiByteToWideChar");

    WString wide(static_cast<usize>(sizeNeeded), L'\0');

    if (MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, text.data(), static_cast<i32>(text.size()), wide.data(), sizeNeeded) == 0)
      ERR_WIN32("MultiByteToWideChar");

    return wide;
  }

  auto ToUtf8(const WStringView text) -> Result<String> {
    if (text.empty())
      return String {};

    const i32 sizeNeeded = WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<i32>(text.size()), nullptr, 0, nullptr, nullptr);

    if (sizeNeeded == 0)
      ERR_WIN32("WideCharToMultiByte");

    String utf8(static_cast<usize>(sizeNeeded), '\0');

    if (WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<i32>(text.size()), utf8.data(), sizeNeeded, nullptr, nullptr) == 0)
      ERR_WIN32("WideCharToMultiByte");

    return utf8;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Files
  // ─────────────────────────────────────────────────────────────────────────────

  auto WindowsFileBackend::open(const String& path, const files::OpenMode mode) -> Result<files::NativeFile> {
    using files::HasMode;
    using files::OpenMode;

    const WString wide = TRY(ToWide(path));

    DWORD access = 0;

    if (HasMode(mode, OpenMode::Read))
      access |= GENERIC_READ;
    if (HasMode(mode, OpenMode::Append))
      access |= FILE_APPEND_DATA;
    else if (HasMode(mode, OpenMode::Write))
      access |= GENERIC_WRITE;

    const bool create   = HasMode(mode, OpenMode::Create);
    const bool truncate = HasMode(mode, OpenMode::Truncate);

    DWORD disposition = OPEN_EXISTING;

    if (create && HasMode(mode, OpenMode::Exclusive))
      disposition = CREATE_NEW;
    else if (create && truncate)
      disposition = CREATE_ALWAYS;
    else if (create)
      disposition = OPEN_ALWAYS;
    else if (truncate)
      disposition = TRUNCATE_EXISTING;

    HANDLE handle = CreateFileW(wide.c_str(), access, FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr, disposition, FILE_ATTRIBUTE_NORMAL, nullptr);

    if (handle == INVALID_HANDLE_VALUE)
      ERR_WIN32("CreateFileW('{}')", path);

    return FromHandle(handle);
  }

  auto WindowsFileBackend::read(const files::NativeFile file, const Span<u8> buffer) -> Result<usize> {
    DWORD got = 0;

    if (!ReadFile(ToHandle(file), buffer.data(), static_cast<DWORD>(std::min<usize>(buffer.size(), MAXDWORD)), &got, nullptr))
      ERR_WIN32("ReadFile");

    return got;
  }

  auto WindowsFileBackend::write(const files::NativeFile file, const Span<const u8> data) -> Result<usize> {
    DWORD written = 0;

    if (!WriteFile(ToHandle(file), data.data(), static_cast<DWORD>(std::min<usize>(data.size(), MAXDWORD)), &written, nullptr))
      ERR_WIN32("WriteFile");

    return written;
  }

  auto WindowsFileBackend::seek(const files::NativeFile file, const i64 offset, const files::SeekOrigin origin) -> Result<u64> {
    DWORD method = FILE_BEGIN;

    switch (origin) {
      case files::SeekOrigin::Begin:   method = FILE_BEGIN; break;
      case files::SeekOrigin::Current: method = FILE_CURRENT; break;
      case files::SeekOrigin::End:     method = FILE_END; break;
    }

    LARGE_INTEGER distance {};
    LARGE_INTEGER position {};
    distance.QuadPart = offset;

    if (!SetFilePointerEx(ToHandle(file), distance, &position, method))
      ERR_WIN32("SetFilePointerEx({})", offset);

    return static_cast<u64>(position.QuadPart);
  }

  auto WindowsFileBackend::sync(const files::NativeFile file) -> Result<> {
    if (!FlushFileBuffers(ToHandle(file)))
      ERR_WIN32("FlushFileBuffers");

    return {};
  }

  auto WindowsFileBackend::close(const files::NativeFile file) -> Result<> {
    if (!CloseHandle(ToHandle(file)))
      ERR_WIN32("CloseHandle");

    return {};
  }

  auto WindowsFileBackend::stat(const String& path, const bool followLinks) -> Result<files::FileStat> {
    const WString wide = TRY(ToWide(path));

    if (followLinks) {
      // FILE_FLAG_BACKUP_SEMANTICS lets CreateFileW open directories.
      const HandleGuard handle(CreateFileW(wide.c_str(), 0, FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr, OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr));

      if (!handle)
        ERR_WIN32("CreateFileW('{}')", path);

      BY_HANDLE_FILE_INFORMATION info {};

      if (!GetFileInformationByHandle(handle.get(), &info))
        ERR_WIN32("GetFileInformationByHandle('{}')", path);

      files::FileStat result = ToFileStat(path, info.dwFileAttributes & ~static_cast<DWORD>(FILE_ATTRIBUTE_REPARSE_POINT), info.nFileSizeHigh, info.nFileSizeLow, info.ftLastWriteTime);

      result.identity = files::FileIdentity {
        .device = info.dwVolumeSerialNumber,
        .file   = (static_cast<u64>(info.nFileIndexHigh) << 32) | info.nFileIndexLow,
      };

      return result;
    }

    WIN32_FILE_ATTRIBUTE_DATA info {};

    if (!GetFileAttributesExW(wide.c_str(), GetFileExInfoStandard, &info))
      ERR_WIN32("GetFileAttributesExW('{}')", path);

    return ToFileStat(path, info.dwFileAttributes, info.nFileSizeHigh, info.nFileSizeLow, info.ftLastWriteTime);
  }

  auto WindowsFileBackend::list(const String& path) -> Result<Vec<files::DirEntry>> {
    const WString pattern = TRY(ToWide(path.ends_with('\\') ? path + "*" : path + "\\*"));

    WIN32_FIND_DATAW findData;

    HANDLE find = FindFirstFileW(pattern.c_str(), &findData);

    if (find == INVALID_HANDLE_VALUE)
      ERR_WIN32("FindFirstFileW('{}')", path);

    Vec<files::DirEntry> entries;
    Result<>             failure;

    do {
      const WStringView name(findData.cFileName);

      if (name == L"." || name == L"..")
        continue;

      Result<String> utf8 = ToUtf8(name);

      if (!utf8) {
        failure = Err(utf8.error());
        break;
      }

      entries.push_back({ .name = std::move(*utf8), .type = TypeOf(findData.dwFileAttributes) });
    } while (FindNextFileW(find, &findData));

    const DWORD lastError = GetLastError();

    FindClose(find);

    if (!failure)
      return Err(failure.error());

    if (lastError != ERROR_NO_MORE_FILES && lastError != ERROR_SUCCESS)
      return Err(FromWin32(lastError, std::format("FindNextFileW('{}')", path)));

    std::ranges::sort(entries, {}, &files::DirEntry::name);
    return entries;
  }

  auto WindowsFileBackend::remove(const String& path) -> Result<> {
    const WString wide = TRY(ToWide(path));

    const DWORD attributes = GetFileAttributesW(wide.c_str());

    if (attributes == INVALID_FILE_ATTRIBUTES)
      ERR_WIN32("GetFileAttributesW('{}')", path);

    if (attributes & FILE_ATTRIBUTE_DIRECTORY) {
      if (!RemoveDirectoryW(wide.c_str()))
        ERR_WIN32("RemoveDirectoryW('{}')", path);
    } else if (!DeleteFileW(wide.c_str())) {
      ERR_WIN32("DeleteFileW('{}')", path);
    }

    return {};
  }

  auto WindowsFileBackend::createDirectory(const String& path) -> Result<> {
    const WString wide = TRY(ToWide(path));

    if (!CreateDirectoryW(wide.c_str(), nullptr))
      ERR_WIN32("CreateDirectoryW('{}')", path);

    return {};
  }

  auto WindowsFileBackend::rename(const String& from, const String& to) -> Result<> {
    const WString wideFrom = TRY(ToWide(from));
    const WString wideTo   = TRY(ToWide(to));

    // POSIX rename replaces an existing target; match it.
    if (!MoveFileExW(wideFrom.c_str(), wideTo.c_str(), MOVEFILE_REPLACE_EXISTING))
      ERR_WIN32("MoveFileExW('{}', '{}')", from, to);

    return {};
  }

  auto WindowsFileBackend::setPermissions(const String& path, const files::Permissions permissions) -> Result<> {
    const WString wide = TRY(ToWide(path));

    const DWORD attributes = GetFileAttributesW(wide.c_str());

    if (attributes == INVALID_FILE_ATTRIBUTES)
      ERR_WIN32("GetFileAttributesW('{}')", path);

    const DWORD updated = permissions.writable ? (attributes & ~static_cast<DWORD>(FILE_ATTRIBUTE_READONLY))
                                               : (attributes | FILE_ATTRIBUTE_READONLY);

    if (updated != attributes && !SetFileAttributesW(wide.c_str(), updated))
      ERR_WIN32("SetFileAttributesW('{}')", path);

    return {};
  }

  auto WindowsFileBackend::copy(const String& from, const String& to, const bool overwrite) -> Result<u64> {
    const WString wideFrom = TRY(ToWide(from));
    const WString wideTo   = TRY(ToWide(to));

    WIN32_FILE_ATTRIBUTE_DATA info {};

    if (!GetFileAttributesExW(wideFrom.c_str(), GetFileExInfoStandard, &info))
      ERR_WIN32("GetFileAttributesExW('{}')", from);

    if (info.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY)
      ERR_FMT(InvalidArgument, "Cannot copy directory '{}'", from);

    // CopyFileW carries the attributes (and so the read-only bit) across.
    if (!CopyFileW(wideFrom.c_str(), wideTo.c_str(), overwrite ? FALSE : TRUE))
      ERR_WIN32("CopyFileW('{}', '{}')", from, to);

    return (static_cast<u64>(info.nFileSizeHigh) << 32) | info.nFileSizeLow;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Processes
  // ─────────────────────────────────────────────────────────────────────────────

  auto WindowsProcessBackend::spawn(const process::SpawnRequest& request) -> Result<process::NativeProcess> {
    String commandLine;

    for (const String& arg : request.args) {
      if (!commandLine.empty())
        commandLine += ' ';
      commandLine += QuoteArgument(arg);
    }

    WString wideCommand = TRY(ToWide(commandLine));
    const WString wideProgram = TRY(ToWide(request.program));

    // Double-NUL terminated block of "KEY=VALUE\0" entries.
    WString environment;

    for (const String& entry : request.environment) {
      environment += TRY(ToWide(entry));
      environment += L'\0';
    }
    environment += L'\0';

    Option<WString> workingDirectory;

    if (request.workingDirectory)
      workingDirectory = TRY(ToWide(*request.workingDirectory));

    HandleGuard stdoutRead, stdoutWrite, stderrRead, stderrWrite;

    STARTUPINFOW startup {};
    startup.cb = sizeof(startup);

    if (request.captureOutput) {
      std::tie(stdoutRead, stdoutWrite) = TRY(MakePipe());
      std::tie(stderrRead, stderrWrite) = TRY(MakePipe());

      startup.dwFlags    = STARTF_USESTDHANDLES;
      startup.hStdInput  = GetStdHandle(STD_INPUT_HANDLE);
      startup.hStdOutput = stdoutWrite.get();
      startup.hStdError  = stderrWrite.get();
    }

    PROCESS_INFORMATION info {};

    if (!CreateProcessW(
          wideProgram.c_str(),
          wideCommand.data(),
          nullptr,
          nullptr,
          request.captureOutput ? TRUE : FALSE,
          CREATE_NEW_PROCESS_GROUP | CREATE_UNICODE_ENVIRONMENT,
          environment.data(),
          workingDirectory ? workingDirectory->c_str() : nullptr,
          &startup,
          &info
        ))
      ERR_WIN32("CreateProcessW('{}')", request.program);

    CloseHandle(info.hThread);

    return process::NativeProcess {
      .pid        = static_cast<i64>(info.dwProcessId),
      .handle     = FromHandle(info.hProcess),
      .stdoutPipe = request.captureOutput ? FromHandle(stdoutRead.release()) : -1,
      .stderrPipe = request.captureOutput ? FromHandle(stderrRead.release()) : -1,
      .sentSignal = None,
    };
  }

  auto WindowsProcessBackend::poll(process::NativeProcess& process) -> Result<Option<process::ExitStatus>> {
    const DWORD state = WaitForSingleObject(ToHandle(process.handle), 0);

    if (state == WAIT_TIMEOUT)
      return None;

    if (state == WAIT_FAILED)
      ERR_WIN32("WaitForSingleObject(process {})", process.pid);

    DWORD code = 0;

    if (!GetExitCodeProcess(ToHandle(process.handle), &code))
      ERR_WIN32("GetExitCodeProcess({})", process.pid);

    return DecodeExit(process, code);
  }

  auto WindowsProcessBackend::wait(process::NativeProcess& process) -> Result<process::ExitStatus> {
    if (WaitForSingleObject(ToHandle(process.handle), INFINITE) == WAIT_FAILED)
      ERR_WIN32("WaitForSingleObject(process {})", process.pid);

    DWORD code = 0;

    if (!GetExitCodeProcess(ToHandle(process.handle), &code))
      ERR_WIN32("GetExitCodeProcess({})", process.pid);

    return DecodeExit(process, code);
  }

  auto WindowsProcessBackend::signal(process::NativeProcess& process, const process::Signal signal) -> Result<> {
    using process::SignalKind;

    switch (signal.kind) {
      case SignalKind::Terminate:
      case SignalKind::Kill:
        if (!TerminateProcess(ToHandle(process.handle), static_cast<UINT>(128 + (signal.kind == SignalKind::Kill ? SigKill : SigTerm))))
          ERR_WIN32("TerminateProcess({})", process.pid);
        break;

      case SignalKind::Interrupt:
        // The child leads its own process group, so the group id is its pid.
        if (!GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, static_cast<DWORD>(process.pid)))
          ERR_WIN32("GenerateConsoleCtrlEvent({})", process.pid);
        break;

      case SignalKind::Custom:
        ERR_FMT(Unsupported, "Signal {} has no Windows equivalent", signal.number);
    }

    process.sentSignal = signal;
    return {};
  }

  auto WindowsProcessBackend::readOutput(process::NativeProcess& process, const Option<Millis> timeout) -> Result<Pair<String, String>> {
    const Option<Clock::time_point> deadline = timeout ? Option<Clock::time_point>(Clock::now() + *timeout) : None;

    String out;
    String err;

    // Anonymous pipes cannot be waited on, so poll them.
    bool stdoutOpen = process.stdoutPipe != -1;
    bool stderrOpen = process.stderrPipe != -1;

    while (stdoutOpen || stderrOpen) {
      bool progressed = false;

      if (stdoutOpen)
        stdoutOpen = TRY(DrainAvailable(ToHandle(process.stdoutPipe), out, progressed));

      if (stderrOpen)
        stderrOpen = TRY(DrainAvailable(ToHandle(process.stderrPipe), err, progressed));

      if (progressed || (!stdoutOpen && !stderrOpen))
        continue;

      if (deadline && Clock::now() >= *deadline)
        ERR_FMT(Timeout, "Output of process {} still open after {}ms", process.pid, timeout->count());

      Sleep(1);
    }

    return Pair(std::move(out), std::move(err));
  }

  auto WindowsProcessBackend::readPipe(const isize pipe) -> Result<String> {
    String out;

    Array<char, ReadChunk> buffer {};

    while (true) {
      DWORD got = 0;

      if (!ReadFile(ToHandle(pipe), buffer.data(), static_cast<DWORD>(buffer.size()), &got, nullptr)) {
        if (GetLastError() == ERROR_BROKEN_PIPE)
          break;

        ERR_WIN32("ReadFile(pipe)");
      }

      if (got == 0)
        break;

      out.append(buffer.data(), got);
    }

    return out;
  }

  auto WindowsProcessBackend::release(process::NativeProcess& process) -> Result<> {
    Result<> result;

    for (isize* handle : { &process.stdoutPipe, &process.stderrPipe, &process.handle }) {
      if (*handle == -1)
        continue;

      if (!CloseHandle(ToHandle(std::exchange(*handle, -1))) && result)
        result = Err(FromWin32(GetLastError(), std::format("CloseHandle(process {})", process.pid)));
    }

    return result;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Sockets
  // ─────────────────────────────────────────────────────────────────────────────

  auto WindowsSocketBackend::connect(const network::Address& address, const network::Protocol protocol, const Option<Millis> timeout) -> Result<network::NativeSocket> {
    addrinfo* candidates = TRY(Resolve(address, protocol, false));

    const std::unique_ptr<addrinfo, decltype([](addrinfo* info) { freeaddrinfo(info); })> owner(candidates);

    Option<ConduitError> lastError;

    for (const addrinfo* info = candidates; info != nullptr; info = info->ai_next) {
      SOCKET sock = socket(info->ai_family, info->ai_socktype, info->ai_protocol);

      if (sock == INVALID_SOCKET) {
        lastError = WsaError("socket");
        continue;
      }

      const auto fail = [&](ConduitError error) -> void {
        closesocket(sock);
        lastError = std::move(error);
      };

      u_long nonBlocking = timeout ? 1 : 0;

      if (timeout && ioctlsocket(sock, FIONBIO, &nonBlocking) == SOCKET_ERROR) {
        fail(WsaError("ioctlsocket(FIONBIO)"));
        continue;
      }

      if (::connect(sock, info->ai_addr, static_cast<int>(info->ai_addrlen)) == SOCKET_ERROR) {
        if (!timeout || WSAGetLastError() != WSAEWOULDBLOCK) {
          fail(WsaError(std::format("connect({}:{})", address.host, address.port)));
          continue;
        }

        Result<bool> ready = WaitReadable(sock, POLLWRNORM, *timeout);

        if (!ready) {
          fail(ready.error());
          continue;
        }

        if (!*ready) {
          fail(ConduitError(Timeout, std::format("connect({}:{}) did not complete within {}ms", address.host, address.port, timeout->count())));
          continue;
        }

        int pending = 0;
        int len     = sizeof(pending);

        // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
        if (getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&pending), &len) == SOCKET_ERROR || pending != 0) {
          fail(FromWin32(static_cast<u32>(pending != 0 ? pending : WSAGetLastError()), std::format("connect({}:{})", address.host, address.port)));
          continue;
        }
      }

      nonBlocking = 0;

      if (timeout && ioctlsocket(sock, FIONBIO, &nonBlocking) == SOCKET_ERROR) {
        fail(WsaError("ioctlsocket(FIONBIO)"));
        continue;
      }

      return static_cast<network::NativeSocket>(sock);
    }

    if (lastError)
      return Err(*lastError);

    ERR_FMT(NotFound, "'{}' resolved to no usable address", address.host);
  }

  auto WindowsSocketBackend::listen(const network::Address& address, const i32 backlog) -> Result<Pair<network::NativeSocket, u16>> {
    addrinfo* candidates = TRY(Resolve(address, network::Protocol::Tcp, true));

    const std::unique_ptr<addrinfo, decltype([](addrinfo* info) { freeaddrinfo(info); })> owner(candidates);

    SOCKET sock = socket(candidates->ai_family, candidates->ai_socktype, candidates->ai_protocol);

    if (sock == INVALID_SOCKET)
      return Err(WsaError("socket"));

    const auto fail = [&](const StringView what) -> Result<Pair<network::NativeSocket, u16>> {
      ConduitError error = WsaError(what);
      closesocket(sock);
      return Err(std::move(error));
    };

    // SO_REUSEADDR on Windows allows port stealing; exclusive use is the safe equivalent.
    if (!SetIntOption(sock, SO_EXCLUSIVEADDRUSE, 1, "SO_EXCLUSIVEADDRUSE"))
      return fail("setsockopt(SO_EXCLUSIVEADDRUSE)");

    if (bind(sock, candidates->ai_addr, static_cast<int>(candidates->ai_addrlen)) == SOCKET_ERROR)
      return fail(std::format("bind({}:{})", address.host, address.port));

    if (::listen(sock, backlog) == SOCKET_ERROR)
      return fail(std::format("listen({}:{})", address.host, address.port));

    sockaddr_storage bound {};
    int              len = sizeof(bound);

    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&bound), &len) == SOCKET_ERROR)
      return fail("getsockname");

    return Pair(static_cast<network::NativeSocket>(sock), PeerOf(bound, len).port);
  }

  auto WindowsSocketBackend::accept(const network::NativeSocket listener, const Option<Millis> timeout) -> Result<Pair<network::NativeSocket, network::Address>> {
    if (timeout && !TRY(WaitReadable(ToSocket(listener), POLLRDNORM, *timeout)))
      ERR_FMT(Timeout, "No connection within {}ms", timeout->count());

    sockaddr_storage peer {};
    int              len = sizeof(peer);

    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    const SOCKET client = ::accept(ToSocket(listener), reinterpret_cast<sockaddr*>(&peer), &len);

    if (client == INVALID_SOCKET)
      return Err(WsaError("accept"));

    return Pair(static_cast<network::NativeSocket>(client), PeerOf(peer, len));
  }

  auto WindowsSocketBackend::send(const network::NativeSocket socket, const Span<const u8> data) -> Result<usize> {
    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    const int sent = ::send(ToSocket(socket), reinterpret_cast<const char*>(data.data()), static_cast<int>(std::min<usize>(data.size(), INT_MAX)), 0);

    if (sent == SOCKET_ERROR)
      return Err(WsaError("send"));

    return static_cast<usize>(sent);
  }

  auto WindowsSocketBackend::receive(const network::NativeSocket socket, const Span<u8> buffer, const Option<Millis> timeout) -> Result<usize> {
    if (timeout && !TRY(WaitReadable(ToSocket(socket), POLLRDNORM, *timeout)))
      ERR_FMT(Timeout, "Nothing received within {}ms", timeout->count());

    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    const int got = recv(ToSocket(socket), reinterpret_cast<char*>(buffer.data()), static_cast<int>(std::min<usize>(buffer.size(), INT_MAX)), 0);

    if (got == SOCKET_ERROR)
      return Err(WsaError("recv"));

    return static_cast<usize>(got);
  }

  auto WindowsSocketBackend::setOption(const network::NativeSocket socket, const network::SocketOption option, const network::OptionValue& value) -> Result<> {
    using network::SocketOption;

    const SOCKET sock = ToSocket(socket);

    switch (option) {
      case SocketOption::Timeout: {
        const int ms = static_cast<int>(std::get<Millis>(value).count());
        TRY_VOID(SetIntOption(sock, SO_RCVTIMEO, ms, "SO_RCVTIMEO"));
        return SetIntOption(sock, SO_SNDTIMEO, ms, "SO_SNDTIMEO");
      }

      case SocketOption::KeepAlive:
        return SetIntOption(sock, SO_KEEPALIVE, std::get<bool>(value) ? 1 : 0, "SO_KEEPALIVE");

      case SocketOption::BufferSize: {
        const int size = static_cast<int>(std::get<i64>(value));
        TRY_VOID(SetIntOption(sock, SO_RCVBUF, size, "SO_RCVBUF"));
        return SetIntOption(sock, SO_SNDBUF, size, "SO_SNDBUF");
      }

      case SocketOption::ReceiveBufferSize:
        return SetIntOption(sock, SO_RCVBUF, static_cast<int>(std::get<i64>(value)), "SO_RCVBUF");

      case SocketOption::SendBufferSize:
        return SetIntOption(sock, SO_SNDBUF, static_cast<int>(std::get<i64>(value)), "SO_SNDBUF");
    }

    ERR(Unsupported, "Unknown socket option");
  }

  auto WindowsSocketBackend::close(const network::NativeSocket socket) -> Result<> {
    if (closesocket(ToSocket(socket)) == SOCKET_ERROR)
      return Err(WsaError("closesocket"));

    return {};
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Telemetry
  // ─────────────────────────────────────────────────────────────────────────────

  auto WindowsTelemetryBackend::cpuTime() -> Result<f64> {
    FILETIME creation {}, exitTime {}, kernel {}, user {};

    if (!GetProcessTimes(GetCurrentProcess(), &creation, &exitTime, &kernel, &user))
      ERR_WIN32("GetProcessTimes");

    const auto seconds = [](const FILETIME& time) -> f64 {
      const u64 ticks = (static_cast<u64>(time.dwHighDateTime) << 32) | time.dwLowDateTime;
      return static_cast<f64>(ticks) / 10'000'000.0;
    };

    return seconds(kernel) + seconds(user);
  }

  auto WindowsTelemetryBackend::memory() -> Result<telemetry::MemoryUsage> {
    PROCESS_MEMORY_COUNTERS_EX counters {};
    counters.cb = sizeof(counters);

    // NOLINTNEXTLINE(*-pro-type-reinterpret-cast)
    if (!GetProcessMemoryInfo(GetCurrentProcess(), reinterpret_cast<PROCESS_MEMORY_COUNTERS*>(&counters), sizeof(counters)))
      ERR_WIN32("GetProcessMemoryInfo");

    return telemetry::MemoryUsage {
      .resident    = static_cast<u64>(counters.WorkingSetSize),
      .virtualSize = static_cast<u64>(counters.PrivateUsage),
    };
  }

  auto WindowsTelemetryBackend::systemMemoryUsed() -> Result<u64> {
    // dwLength is required to be set as per WinAPI.
    MEMORYSTATUSEX memInfo;
    memInfo.dwLength = sizeof(MEMORYSTATUSEX);

    if (!GlobalMemoryStatusEx(&memInfo))
      ERR_WIN32("GlobalMemoryStatusEx");

    return memInfo.ullTotalPhys - memInfo.ullAvailPhys;
  }

  auto WindowsTelemetryBackend::io() -> Result<telemetry::IoCounters> {
    IO_COUNTERS counters {};

    if (!GetProcessIoCounters(GetCurrentProcess(), &counters))
      ERR_WIN32("GetProcessIoCounters");

    return telemetry::IoCounters { .readBytes = counters.ReadTransferCount, .writeBytes = counters.WriteTransferCount };
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Event Log
  // ─────────────────────────────────────────────────────────────────────────────

  auto EventLogBackend::open(const String& ident) -> Result<isize> {
    const WString source = TRY(ToWide(ident));

    HANDLE handle = RegisterEventSourceW(nullptr, source.c_str());

    if (handle == nullptr)
      ERR_WIN32("RegisterEventSourceW('{}')", ident);

    return FromHandle(handle);
  }

  auto EventLogBackend::write(const isize handle, const LogLevel level, const StringView text) -> Result<> {
    const WString message = TRY(ToWide(text));
    PWCStr        strings = message.c_str();

    if (!ReportEventW(ToHandle(handle), EventType(level), 0, 0, nullptr, 1, 0, &strings, nullptr))
      ERR_WIN32("ReportEventW");

    return {};
  }

  auto EventLogBackend::close(const isize handle) -> Result<> {
    if (!DeregisterEventSource(ToHandle(handle)))
      ERR_WIN32("DeregisterEventSource");

    return {};
  }
} // namespace conduit::os::windows

#endif // _WIN32
