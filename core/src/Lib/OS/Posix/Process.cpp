#if !defined(_WIN32)

  #include <cerrno>      // errno
  #include <chrono>      // std::chrono::steady_clock
  #include <csignal>     // kill, SIGTERM, SIGINT, SIGKILL
  #include <fcntl.h>     // fcntl, FD_CLOEXEC, O_CLOEXEC
  #include <matchit.hpp> // matchit::{match, is, _}
  #include <poll.h>      // poll, pollfd, POLLIN, POLLHUP
  #include <sys/wait.h>  // waitpid, WIFEXITED, WEXITSTATUS, WIFSIGNALED, WTERMSIG
  #include <tuple>       // std::tie
  #include <unistd.h>    // fork, execve, pipe, pipe2, dup2, chdir, _exit
  #include <utility>     // std::exchange

  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Logging.hpp>

  #include "OS/Posix/Posix.hpp"
  #include "OS/Unix.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::process::ExitStatus;
using conduit::process::NativeProcess;
using conduit::process::Signal;
using conduit::process::SignalKind;
using conduit::process::SpawnRequest;

namespace unix_shared = conduit::os::unix_shared;

using unix_shared::FdGuard;

namespace {
  using Clock = std::chrono::steady_clock;

  constexpr usize ReadChunk = 4096;

  // Exit code of a child whose exec failed; the parent reports the real errno.
  constexpr int ExecFailedCode = 127;

  auto NativeSignal(const Signal signal) -> int {
    using namespace matchit;
    using enum SignalKind;

    return match(signal.kind)(
      is | Terminate = SIGTERM,
      is | Interrupt = SIGINT,
      is | Kill      = SIGKILL,
      is | _         = signal.number
    );
  }

  auto AbstractSignal(const int signo) -> Signal {
    using namespace matchit;

    return match(signo)(
      is | SIGTERM = Signal::terminate(),
      is | SIGINT  = Signal::interrupt(),
      is | SIGKILL = Signal::kill(),
      is | _       = Signal::custom(signo)
    );
  }

  auto DecodeStatus(const int status) -> ExitStatus {
    if (WIFSIGNALED(status)) {
      const int signo = WTERMSIG(status);
      return { .code = 128 + signo, .terminatedBySignal = AbstractSignal(signo) };
    }

    return { .code = WIFEXITED(status) ? WEXITSTATUS(status) : -1, .terminatedBySignal = None };
  }

  /**
   * @brief Both ends are close-on-exec, so a child forked concurrently by another
   * thread never holds them open; dup2 onto stdout/stderr clears the flag.
   */
  auto MakePipe() -> Result<Pair<FdGuard, FdGuard>> {
    Array<int, 2> fds {};

  #if defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
    if (::pipe2(fds.data(), O_CLOEXEC) == -1)
      ERR_ERRNO("pipe2");

    return Pair(FdGuard(fds[0]), FdGuard(fds[1]));
  #else
    if (::pipe(fds.data()) == -1)
      ERR_ERRNO("pipe");

    FdGuard readEnd(fds[0]);
    FdGuard writeEnd(fds[1]);

    for (const int fd : { readEnd.get(), writeEnd.get() })
      if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
        ERR_ERRNO("fcntl(FD_CLOEXEC)");

    return Pair(std::move(readEnd), std::move(writeEnd));
  #endif
  }

  /**
   * @brief dup2 onto the same descriptor keeps FD_CLOEXEC, so clear it by hand in that case.
   */
  auto Redirect(const int from, const int to) -> bool {
    if (from == to)
      return ::fcntl(to, F_SETFD, 0) != -1;

    return ::dup2(from, to) != -1;
  }

  /**
   * @brief Child side of spawn. Only async-signal-safe calls from here on.
   */
  [[noreturn]] auto ExecChild(
    const SpawnRequest& request,
    char* const*        argv,
    char* const*        envp,
    const int           stdoutFd,
    const int           stderrFd,
    const int           errorFd
  ) -> void {
    const auto fail = [errorFd] {
      const int err = errno;
      // Best effort: the parent treats a short read as a successful exec.
      [[maybe_unused]] const ssize_t written = ::write(errorFd, &err, sizeof(err));
      ::_exit(ExecFailedCode);
    };

    if (request.workingDirectory && ::chdir(request.workingDirectory->c_str()) == -1)
      fail();

    if (stdoutFd >= 0 && !Redirect(stdoutFd, STDOUT_FILENO))
      fail();

    if (stderrFd >= 0 && !Redirect(stderrFd, STDERR_FILENO))
      fail();

    ::execve(request.program.c_str(), argv, envp);
    fail();
    ::_exit(ExecFailedCode);
  }

  auto ReadAvailable(const int fd, String& out) -> Result<bool> {
    Array<char, ReadChunk> buffer {};

    const ssize_t count = unix_shared::RetryOnEintr([&] { return ::read(fd, buffer.data(), buffer.size()); });

    if (count == -1)
      ERR_ERRNO("read(pipe {})", fd);

    out.append(buffer.data(), static_cast<usize>(count));
    return count > 0;
  }
} // namespace

namespace conduit::os::posix {
  auto PosixProcessBackend::spawn(const SpawnRequest& request) -> Result<NativeProcess> {
    Vec<char*> argv;
    argv.reserve(request.args.size() + 1);
    for (const String& arg : request.args)
      argv.push_back(const_cast<char*>(arg.c_str())); // NOLINT(cppcoreguidelines-pro-type-const-cast) - execve takes char* const[]
    argv.push_back(nullptr);

    Vec<char*> envp;
    envp.reserve(request.environment.size() + 1);
    for (const String& entry : request.environment)
      envp.push_back(const_cast<char*>(entry.c_str())); // NOLINT(cppcoreguidelines-pro-type-const-cast)
    envp.push_back(nullptr);

    auto [errorRead, errorWrite] = TRY(MakePipe());

    FdGuard stdoutRead, stdoutWrite, stderrRead, stderrWrite;

    if (request.captureOutput) {
      std::tie(stdoutRead, stdoutWrite) = TRY(MakePipe());
      std::tie(stderrRead, stderrWrite) = TRY(MakePipe());
    }

    const pid_t pid = ::fork();

    if (pid == -1)
      ERR_ERRNO("fork for '{}'", request.program);

    if (pid == 0)
      ExecChild(request, argv.data(), envp.data(), stdoutWrite.get(), stderrWrite.get(), errorWrite.get());

    // Parent: drop the child's ends so EOF arrives when the child exits.
    stdoutWrite = FdGuard();
    stderrWrite = FdGuard();
    errorWrite  = FdGuard();

    int           childErrno = 0;
    const ssize_t got        = unix_shared::RetryOnEintr([&] { return ::read(errorRead.get(), &childErrno, sizeof(childErrno)); });

    if (got == sizeof(childErrno)) {
      int status = 0;
      if (unix_shared::RetryOnEintr([&] { return ::waitpid(pid, &status, 0); }) == -1)
        debug_log("Could not reap {} after its exec failed (errno {})", pid, errno);

      return Err(utils::error::FromErrno(childErrno, std::format("exec('{}')", request.program)));
    }

    return NativeProcess {
      .pid        = static_cast<i64>(pid),
      .handle     = -1,
      .stdoutPipe = request.captureOutput ? static_cast<isize>(stdoutRead.release()) : -1,
      .stderrPipe = request.captureOutput ? static_cast<isize>(stderrRead.release()) : -1,
      .sentSignal = None,
    };
  }

  auto PosixProcessBackend::poll(NativeProcess& process) -> Result<Option<ExitStatus>> {
    int         status = 0;
    const pid_t done   = unix_shared::RetryOnEintr([&] { return ::waitpid(static_cast<pid_t>(process.pid), &status, WNOHANG); });

    if (done == -1)
      ERR_ERRNO("waitpid({})", process.pid);

    if (done == 0)
      return None;

    return DecodeStatus(status);
  }

  auto PosixProcessBackend::wait(NativeProcess& process) -> Result<ExitStatus> {
    int status = 0;

    if (unix_shared::RetryOnEintr([&] { return ::waitpid(static_cast<pid_t>(process.pid), &status, 0); }) == -1)
      ERR_ERRNO("waitpid({})", process.pid);

    return DecodeStatus(status);
  }

  auto PosixProcessBackend::signal(NativeProcess& process, const Signal signal) -> Result<> {
    const int signo = NativeSignal(signal);

    if (::kill(static_cast<pid_t>(process.pid), signo) == -1)
      ERR_ERRNO("kill({}, {})", process.pid, signo);

    process.sentSignal = signal;
    return {};
  }

  auto PosixProcessBackend::readOutput(NativeProcess& process, const Option<Millis> timeout) -> Result<Pair<String, String>> {
    const Option<Clock::time_point> deadline = timeout ? Option<Clock::time_point>(Clock::now() + *timeout) : None;

    String out;
    String err;

    Array<pollfd, 2> fds {
      pollfd { .fd = static_cast<int>(process.stdoutPipe), .events = POLLIN, .revents = 0 },
      pollfd { .fd = static_cast<int>(process.stderrPipe), .events = POLLIN, .revents = 0 },
    };

    // poll ignores negative descriptors, so an uncaptured stream is already "closed".
    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
      int waitMs = -1;

      if (deadline) {
        const auto left = std::chrono::duration_cast<Millis>(*deadline - Clock::now());

        if (left.count() <= 0)
          ERR_FMT(Timeout, "Output of process {} still open after {}ms", process.pid, timeout->count());

        waitMs = static_cast<int>(left.count());
      }

      const int ready = unix_shared::RetryOnEintr([&] { return ::poll(fds.data(), fds.size(), waitMs); });

      if (ready == -1)
        ERR_ERRNO("poll(process {} output)", process.pid);

      if (ready == 0)
        continue;

      for (usize i = 0; i < fds.size(); ++i) {
        if (fds.at(i).fd < 0 || fds.at(i).revents == 0)
          continue;

        if (!TRY(ReadAvailable(fds.at(i).fd, i == 0 ? out : err)))
          fds.at(i).fd = -1;
      }
    }

    return Pair(std::move(out), std::move(err));
  }

  auto PosixProcessBackend::readPipe(const isize pipe) -> Result<String> {
    String out;

    while (TRY(ReadAvailable(static_cast<int>(pipe), out))) {}

    return out;
  }

  auto PosixProcessBackend::release(NativeProcess& process) -> Result<> {
    Result<> result;

    for (isize* pipe : { &process.stdoutPipe, &process.stderrPipe }) {
      if (*pipe < 0)
        continue;

      if (Result<> closed = unix_shared::CloseFd(static_cast<int>(std::exchange(*pipe, -1)), "process pipe"); !closed && result)
        result = closed;
    }

    return result;
  }
} // namespace conduit::os::posix

#endif // !defined(_WIN32)
