#pragma once

#include "../Core/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace conduit::process {
  namespace types = ::conduit::utils::types;

  class ProcessBackend;

  enum class SignalKind : types::u8 {
    Terminate, ///< Polite request to exit (SIGTERM; TerminateProcess on Windows).
    Interrupt, ///< Keyboard interrupt (SIGINT; CTRL_BREAK_EVENT on Windows).
    Kill,      ///< Immediate, uncatchable termination (SIGKILL; TerminateProcess on Windows).
    Custom,    ///< Raw POSIX signal number; Unsupported on Windows.
  };

  struct Signal {
    SignalKind kind   = SignalKind::Terminate;
    types::i32 number = 0; ///< Only meaningful for Custom.

    auto operator==(const Signal&) const -> bool = default;

    static constexpr auto terminate() -> Signal { return { SignalKind::Terminate, 0 }; }
    static constexpr auto interrupt() -> Signal { return { SignalKind::Interrupt, 0 }; }
    static constexpr auto kill() -> Signal { return { SignalKind::Kill, 0 }; }
    static constexpr auto custom(const types::i32 number) -> Signal { return { SignalKind::Custom, number }; }
  };

  /**
   * @struct ExitStatus
   * @brief Normalized process exit.
   *
   * `code` is the exit code for a normal exit. When the process was ended by a
   * signal, `terminatedBySignal` names it and `code` is 128 + the POSIX signal
   * number (the shell convention). On Windows a process ended through
   * Process::signal reports that signal with the exit code it was given.
   */
  struct ExitStatus {
    types::i32            code = 0;
    types::Option<Signal> terminatedBySignal;

    auto operator==(const ExitStatus&) const -> bool = default;

    [[nodiscard]] auto success() const -> bool {
      return code == 0 && !terminatedBySignal;
    }
  };

  struct SpawnOptions {
    types::String                            command; ///< Logical path, or a bare name looked up on PATH.
    types::Vec<types::String>                args;
    types::Map<types::String, types::String> environment; ///< Added to (or replacing entries of) the parent environment.
    types::Option<types::String>             workingDirectory;
    bool                                     captureOutput = false; ///< Pipe stdout/stderr instead of inheriting them.
  };

  struct CommandResult {
    ExitStatus    status;
    types::String stdoutText;
    types::String stderrText;
    types::Millis elapsed { 0 };

    [[nodiscard]] auto success() const -> bool {
      return status.success();
    }
  };

  /**
   * @brief Native process identity and the pipes attached to it.
   */
  struct NativeProcess {
    types::i64   pid          = -1;
    types::isize handle       = -1; ///< Process HANDLE on Windows; unused on POSIX.
    types::isize stdoutPipe   = -1;
    types::isize stderrPipe   = -1;
    types::Option<Signal> sentSignal; ///< Last terminating signal delivered through this handle.
  };

  /**
   * @class Process
   * @brief Exclusively owned handle to a spawned child process.
   *
   * Once the child has exited, its status is cached and every further wait()
   * returns it unchanged. Not safe for concurrent use from several threads.
   * Destroying a handle releases its native resources but does not kill the
   * child.
   */
  class Process {
   public:
    Process() = default;
    Process(const Process&) = delete;
    Process(Process&& other) noexcept;
    auto operator=(const Process&) -> Process& = delete;
    auto operator=(Process&& other) noexcept -> Process&;
    ~Process();

    [[nodiscard]] auto pid() const -> types::i64 {
      return m_native.pid;
    }

    /**
     * @brief True while the child is running. Reaps it (caching the status) if it has exited.
     */
    auto isAlive() -> types::Result<bool>;

    /**
     * @brief Delivers a signal.
     * @return NotFound if the process has already exited; Unsupported if the platform lacks the signal.
     */
    auto signal(Signal signal) -> types::Result<>;

    /**
     * @brief Waits for the child to exit.
     * @param timeout  None blocks indefinitely; zero polls without blocking; a positive value
     *                 blocks at most that long. Either of the latter yields Timeout if the
     *                 child is still running.
     */
    auto wait(types::Option<types::Millis> timeout = types::None) -> types::Result<ExitStatus>;

    /**
     * @brief Reads captured stdout until the child closes it.
     * @return InvalidArgument if output was not captured.
     */
    auto readStdout() -> types::Result<types::String>;

    auto readStderr() -> types::Result<types::String>;

    /**
     * @brief Reads stdout and stderr together until both close, without risking a pipe deadlock.
     */
    auto readOutput() -> types::Result<types::Pair<types::String, types::String>>;

    /**
     * @brief Releases the native handle and any pipes. The child keeps running.
     */
    auto close() -> types::Result<>;

    [[nodiscard]] auto isOpen() const -> bool {
      return m_backend != nullptr;
    }

   private:
    friend class ProcessManager;

    Process(const core::Context& ctx, ProcessBackend& backend, NativeProcess native);

    auto requireOpen() const -> types::Result<>;

    const core::Context*             m_ctx     = nullptr;
    ProcessBackend*                  m_backend = nullptr;
    NativeProcess                    m_native;
    types::Option<ExitStatus>        m_exit;
  };

  /**
   * @class ProcessManager
   * @brief Process management adapter.
   */
  class ProcessManager {
   public:
    explicit ProcessManager(const core::Context& ctx);

    /**
     * @brief Starts a child process.
     * @return NotFound if the command cannot be resolved; PermissionDenied if it is not executable.
     */
    auto spawn(const SpawnOptions& options) -> types::Result<Process>;

    /**
     * @brief Spawns with captured output, drains it, and waits.
     * @param timeout  Upper bound for the wait; on Timeout the child is killed and reaped.
     */
    auto run(SpawnOptions options, types::Option<types::Millis> timeout = types::None) -> types::Result<CommandResult>;

    /**
     * @brief Searches PATH (and PATHEXT on Windows) for an executable. Returns its logical path.
     */
    auto findExecutable(types::StringView name) const -> types::Result<types::String>;

    auto commandExists(types::StringView name) const -> bool;

   private:
    const core::Context& m_ctx;
  };
} // namespace conduit::process
