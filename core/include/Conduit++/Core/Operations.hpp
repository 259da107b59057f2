#pragma once

#include "../Utils/Types.hpp"

/**
 * @brief Names of every abstract operation known to the capability registry.
 *
 * Configuration overrides and C API callers refer to operations by these
 * strings, so they are part of the stable interface.
 */
namespace conduit::core::ops {
  using StringView = ::conduit::utils::types::StringView;

  // Files
  inline constexpr StringView FileOpen           = "file.open";
  inline constexpr StringView FileStat           = "file.stat";
  inline constexpr StringView FileList           = "file.list";
  inline constexpr StringView FileRemove         = "file.remove";
  inline constexpr StringView FileRemoveAll      = "file.remove_all";
  inline constexpr StringView FileRename         = "file.rename";
  inline constexpr StringView FileCopy           = "file.copy";
  inline constexpr StringView FileCreateDir      = "file.create_directory";
  inline constexpr StringView FileSetPermissions = "file.set_permissions";
  inline constexpr StringView FileSync           = "file.sync";
  inline constexpr StringView FileFind           = "file.find";

  // Processes
  inline constexpr StringView ProcessSpawn           = "process.spawn";
  inline constexpr StringView ProcessWait            = "process.wait";
  inline constexpr StringView ProcessSignalTerminate = "process.signal.terminate";
  inline constexpr StringView ProcessSignalInterrupt = "process.signal.interrupt";
  inline constexpr StringView ProcessSignalKill      = "process.signal.kill";
  inline constexpr StringView ProcessSignalCustom    = "process.signal.custom";

  // Network
  inline constexpr StringView NetConnect           = "net.connect";
  inline constexpr StringView NetListen            = "net.listen";
  inline constexpr StringView NetOptionTimeout     = "net.option.timeout";
  inline constexpr StringView NetOptionKeepAlive   = "net.option.keep_alive";
  inline constexpr StringView NetOptionBufferSize  = "net.option.buffer_size";
  inline constexpr StringView NetOptionRecvBuffer  = "net.option.receive_buffer_size";
  inline constexpr StringView NetOptionSendBuffer  = "net.option.send_buffer_size";

  // Logging & monitoring
  inline constexpr StringView LogNative           = "log.native";
  inline constexpr StringView MonitorCpuTime      = "monitor.cpu_time";
  inline constexpr StringView MonitorMemory       = "monitor.memory";
  inline constexpr StringView MonitorSystemMemory = "monitor.system_memory";
  inline constexpr StringView MonitorIo           = "monitor.io";
} // namespace conduit::core::ops
