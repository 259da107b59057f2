#pragma once

#include <Conduit++/Core/Capability.hpp>
#include <Conduit++/Process/Process.hpp>
#include <Conduit++/Utils/Types.hpp>

namespace conduit::process {
  namespace types = ::conduit::utils::types;

  /**
   * @brief A fully resolved spawn: native program path, argv and environment block.
   */
  struct SpawnRequest {
    types::String                program;     ///< Native path of the executable.
    types::Vec<types::String>    args;        ///< argv, including argv[0].
    types::Vec<types::String>    environment; ///< "KEY=VALUE" entries; the complete child environment.
    types::Option<types::String> workingDirectory;
    bool                         captureOutput = false;
  };

  class ProcessBackend {
   public:
    ProcessBackend()                                         = default;
    ProcessBackend(const ProcessBackend&)                    = delete;
    ProcessBackend(ProcessBackend&&)                         = delete;
    auto operator=(const ProcessBackend&) -> ProcessBackend& = delete;
    auto operator=(ProcessBackend&&) -> ProcessBackend&      = delete;
    virtual ~ProcessBackend()                                = default;

    virtual auto spawn(const SpawnRequest& request) -> types::Result<NativeProcess> = 0;

    /**
     * @brief Non-blocking: the exit status if the child has exited (reaping it), None otherwise.
     */
    virtual auto poll(NativeProcess& process) -> types::Result<types::Option<ExitStatus>> = 0;

    /**
     * @brief Blocks until the child exits.
     */
    virtual auto wait(NativeProcess& process) -> types::Result<ExitStatus> = 0;

    virtual auto signal(NativeProcess& process, Signal signal) -> types::Result<> = 0;

    /**
     * @brief Drains both output pipes until they close or `timeout` elapses.
     */
    virtual auto readOutput(NativeProcess& process, types::Option<types::Millis> timeout)
      -> types::Result<types::Pair<types::String, types::String>> = 0;

    /**
     * @brief Reads one pipe until end of file.
     */
    virtual auto readPipe(types::isize pipe) -> types::Result<types::String> = 0;

    /**
     * @brief Closes the process handle and any pipes.
     */
    virtual auto release(NativeProcess& process) -> types::Result<> = 0;
  };

  auto GetProcessBackend(core::capability::BackendId id) -> types::Result<ProcessBackend*>;
} // namespace conduit::process
