#include <algorithm> // std::min, std::ranges::find_if
#include <cctype>    // std::tolower
#include <chrono>    // std::chrono::steady_clock
#include <ranges>    // std::views::split
#include <thread>    // std::this_thread::sleep_for

#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Conduit++/Core/Dispatch.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Files/Path.hpp>
#include <Conduit++/Process/Process.hpp>
#include <Conduit++/Utils/Env.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

#include "Process/ProcessBackend.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::Dispatch;
using conduit::core::capability::BackendId;
using conduit::core::platform::PlatformFamily;
using conduit::utils::env::GetEnv;

namespace ops  = conduit::core::ops;
namespace path = conduit::files::path;

namespace {
  using Clock = std::chrono::steady_clock;

  constexpr Millis MaxPollDelay { 50 };

  auto SignalOperation(const conduit::process::SignalKind kind) -> StringView {
    using enum conduit::process::SignalKind;

    switch (kind) {
      case Terminate: return ops::ProcessSignalTerminate;
      case Interrupt: return ops::ProcessSignalInterrupt;
      case Kill:      return ops::ProcessSignalKill;
      case Custom:    return ops::ProcessSignalCustom;
    }

    return ops::ProcessSignalCustom;
  }

  auto EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](const unsigned char left, const unsigned char right) -> bool {
      return std::tolower(left) == std::tolower(right);
    });
  }

  auto Remaining(const Option<Clock::time_point> deadline) -> Option<Millis> {
    if (!deadline)
      return None;

    const auto left = std::chrono::duration_cast<Millis>(*deadline - Clock::now());
    return left.count() > 0 ? left : Millis(0);
  }
} // namespace

namespace conduit::process {
  // ─────────────────────────────────────────────────────────────────────────────
  // Process
  // ─────────────────────────────────────────────────────────────────────────────

  Process::Process(const core::Context& ctx, ProcessBackend& backend, NativeProcess native)
    : m_ctx(&ctx), m_backend(&backend), m_native(std::move(native)) {}

  Process::Process(Process&& other) noexcept
    : m_ctx(other.m_ctx), m_backend(std::exchange(other.m_backend, nullptr)), m_native(std::move(other.m_native)), m_exit(std::move(other.m_exit)) {}

  auto Process::operator=(Process&& other) noexcept -> Process& {
    if (this != &other) {
      if (isOpen())
        if (Result<> released = m_backend->release(m_native); !released)
          warn_at(released.error());

      m_ctx     = other.m_ctx;
      m_backend = std::exchange(other.m_backend, nullptr);
      m_native  = std::move(other.m_native);
      m_exit    = std::move(other.m_exit);
    }

    return *this;
  }

  Process::~Process() {
    if (!isOpen())
      return;

    if (Result<> released = m_backend->release(m_native); !released)
      warn_at(released.error());
  }

  auto Process::requireOpen() const -> Result<> {
    if (!isOpen())
      ERR(InvalidArgument, "Process handle is closed");

    return {};
  }

  auto Process::isAlive() -> Result<bool> {
    if (m_exit)
      return false;

    TRY_VOID(requireOpen());

    const Option<ExitStatus> status = TRY(Dispatch<Option<ExitStatus>>(*m_ctx, ops::ProcessWait, { .native = [this](BackendId) -> Result<Option<ExitStatus>> {
      return m_backend->poll(m_native);
    } }));

    if (status) {
      m_exit = status;
      return false;
    }

    return true;
  }

  auto Process::signal(const Signal signal) -> Result<> {
    if (signal.kind == SignalKind::Custom && signal.number <= 0)
      ERR_FMT(InvalidArgument, "Invalid custom signal number {}", signal.number);

    if (!TRY(isAlive()))
      ERR_FMT(NotFound, "Process {} has already exited", m_native.pid);

    debug_log_fields(Fields(field(pid, m_native.pid), field(signal, magic_enum::enum_name(signal.kind))), "Signalling process");

    return Dispatch<void>(*m_ctx, SignalOperation(signal.kind), { .native = [&](BackendId) -> Result<> {
      return m_backend->signal(m_native, signal);
    } });
  }

  auto Process::wait(const Option<Millis> timeout) -> Result<ExitStatus> {
    if (m_exit)
      return *m_exit;

    TRY_VOID(requireOpen());

    if (!timeout) {
      const ExitStatus status = TRY(Dispatch<ExitStatus>(*m_ctx, ops::ProcessWait, { .native = [this](BackendId) -> Result<ExitStatus> {
        return m_backend->wait(m_native);
      } }));

      m_exit = status;
      return status;
    }

    if (timeout->count() < 0)
      ERR_FMT(InvalidArgument, "Negative wait timeout ({}ms)", timeout->count());

    const Clock::time_point deadline = Clock::now() + *timeout;
    Millis                  delay { 1 };

    while (true) {
      if (!TRY(isAlive()))
        return *m_exit;

      const Clock::time_point now = Clock::now();

      if (now >= deadline)
        ERR_FMT(Timeout, "Process {} still running after {}ms", m_native.pid, timeout->count());

      std::this_thread::sleep_for(std::min<Clock::duration>(delay, deadline - now));
      delay = std::min(delay * 2, MaxPollDelay);
    }
  }

  auto Process::readStdout() -> Result<String> {
    TRY_VOID(requireOpen());

    if (m_native.stdoutPipe == -1)
      ERR(InvalidArgument, "stdout was not captured");

    return m_backend->readPipe(m_native.stdoutPipe);
  }

  auto Process::readStderr() -> Result<String> {
    TRY_VOID(requireOpen());

    if (m_native.stderrPipe == -1)
      ERR(InvalidArgument, "stderr was not captured");

    return m_backend->readPipe(m_native.stderrPipe);
  }

  auto Process::readOutput() -> Result<Pair<String, String>> {
    TRY_VOID(requireOpen());

    if (m_native.stdoutPipe == -1 && m_native.stderrPipe == -1)
      ERR(InvalidArgument, "Output was not captured");

    return m_backend->readOutput(m_native, None);
  }

  auto Process::close() -> Result<> {
    TRY_VOID(requireOpen());

    ProcessBackend* backend = std::exchange(m_backend, nullptr);
    return backend->release(m_native);
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // ProcessManager
  // ─────────────────────────────────────────────────────────────────────────────

  ProcessManager::ProcessManager(const core::Context& ctx) : m_ctx(ctx) {}

  auto ProcessManager::spawn(const SpawnOptions& options) -> Result<Process> {
    if (options.command.empty())
      ERR(InvalidArgument, "Command is empty");

    const PlatformFamily family = m_ctx.profile().family;

    const String program = options.command.contains('/') ? options.command : TRY(findExecutable(options.command));

    SpawnRequest request {
      .program          = TRY(path::ToNative(program, family)),
      .args             = {},
      .environment      = {},
      .workingDirectory = None,
      .captureOutput    = options.captureOutput,
    };

    request.args.reserve(options.args.size() + 1);
    request.args.push_back(options.command);
    request.args.insert(request.args.end(), options.args.begin(), options.args.end());

    Map<String, String> environment = utils::env::GetEnvironment();

    for (const auto& [key, value] : options.environment) {
      if (key.empty() || key.contains('='))
        ERR_FMT(InvalidArgument, "Invalid environment variable name '{}'", key);

      // Windows variable names are case-insensitive.
      if (family == PlatformFamily::Windows)
        std::erase_if(environment, [&](const auto& entry) -> bool { return EqualsIgnoreCase(entry.first, key); });

      environment.insert_or_assign(key, value);
    }

    request.environment.reserve(environment.size());
    for (const auto& [key, value] : environment)
      request.environment.push_back(std::format("{}={}", key, value));

    if (options.workingDirectory)
      request.workingDirectory = TRY(path::ToNative(*options.workingDirectory, family));

    return Dispatch<Process>(m_ctx, ops::ProcessSpawn, { .native = [&](const BackendId id) -> Result<Process> {
      ProcessBackend*     backend = TRY(GetProcessBackend(id));
      const NativeProcess native  = TRY(backend->spawn(request));

      debug_log_fields(Fields(field(pid, native.pid), field(program, request.program)), "Spawned {}", options.command);
      return Process(m_ctx, *backend, native);
    } });
  }

  auto ProcessManager::run(SpawnOptions options, const Option<Millis> timeout) -> Result<CommandResult> {
    options.captureOutput = true;

    const Clock::time_point             start    = Clock::now();
    const Option<Clock::time_point>     deadline = timeout ? Option<Clock::time_point>(start + *timeout) : None;

    Process child = TRY(spawn(options));

    const auto abandon = [&](const utils::error::ConduitError& reason) -> Result<CommandResult> {
      if (Result<> killed = child.signal(Signal::kill()); !killed)
        debug_at(killed.error());

      if (Result<ExitStatus> reaped = child.wait(); !reaped)
        warn_at(reaped.error());

      return Err(reason);
    };

    Result<Pair<String, String>> output = child.m_backend->readOutput(child.m_native, Remaining(deadline));

    if (!output)
      return abandon(output.error());

    Result<ExitStatus> status = child.wait(Remaining(deadline));

    if (!status)
      return abandon(status.error());

    CommandResult result {
      .status     = *status,
      .stdoutText = std::move(output->first),
      .stderrText = std::move(output->second),
      .elapsed    = std::chrono::duration_cast<Millis>(Clock::now() - start),
    };

    TRY_VOID(child.close());

    debug_log_fields(
      Fields(field(code, result.status.code), field(elapsed_ms, result.elapsed.count())),
      "{} finished",
      options.command
    );

    return result;
  }

  auto ProcessManager::findExecutable(const StringView name) const -> Result<String> {
    if (name.empty())
      ERR(InvalidArgument, "Executable name is empty");

    const PlatformFamily family = m_ctx.profile().family;
    files::FileSystem    fs(m_ctx);

    const auto isExecutable = [&](const String& candidate) -> bool {
      Result<files::FileStat> info = fs.stat(candidate);
      return info && info->type == files::EntryType::File && info->permissions.executable;
    };

    if (name.contains('/')) {
      if (isExecutable(String(name)))
        return String(name);

      ERR_FMT(NotFound, "'{}' is not an executable file", name);
    }

    Vec<String> suffixes { "" };

    if (family == PlatformFamily::Windows) {
      const String pathExt = GetEnv("PATHEXT").value_or(".COM;.EXE;.BAT;.CMD");

      for (auto ext : pathExt | std::views::split(';'))
        if (!std::ranges::empty(ext))
          suffixes.emplace_back(ext.begin(), ext.end());
    }

    const String searchPath = TRY(GetEnv("PATH"));

    for (auto entry : searchPath | std::views::split(core::platform::PathListSeparator(family))) {
      const String directory = path::ToLogical(StringView(entry.begin(), entry.end()), family);

      if (directory.empty())
        continue;

      for (const String& suffix : suffixes) {
        const String candidate = path::Join(directory, String(name) + suffix);

        if (isExecutable(candidate))
          return candidate;
      }
    }

    ERR_FMT(NotFound, "'{}' was not found on PATH", name);
  }

  auto ProcessManager::commandExists(const StringView name) const -> bool {
    return findExecutable(name).has_value();
  }
} // namespace conduit::process
