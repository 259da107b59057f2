#ifndef CONDUIT_C_H
#define CONDUIT_C_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(CONDUIT_C_SHARED)
    #if defined(CONDUIT_C_BUILD)
      #define CONDUIT_C_API __declspec(dllexport)
    #else
      #define CONDUIT_C_API __declspec(dllimport)
    #endif
  #else
    #define CONDUIT_C_API
  #endif
#else
  #if defined(CONDUIT_C_SHARED)
    #define CONDUIT_C_API __attribute__((visibility("default")))
  #else
    #define CONDUIT_C_API
  #endif
#endif

#ifdef __cplusplus
extern "C" {
#endif
  // Opaque handle owning a conduit::core::Context and its logger
  typedef struct ConduitContext ConduitContext;

  // Opaque handle owning a spawned child process
  typedef struct ConduitProcess ConduitProcess;

  // Error codes matching conduit::utils::error::ErrorKind
  typedef enum ConduitErrorCode {
    CONDUIT_ERROR_UNSUPPORTED       = 0,
    CONDUIT_ERROR_RESOURCE_BUSY     = 1,
    CONDUIT_ERROR_NOT_FOUND         = 2,
    CONDUIT_ERROR_PERMISSION_DENIED = 3,
    CONDUIT_ERROR_TIMEOUT           = 4,
    CONDUIT_ERROR_INVALID_ARGUMENT  = 5,
    CONDUIT_ERROR_PLATFORM_ERROR    = 6,
    CONDUIT_SUCCESS                 = 255 // Not an error - operation succeeded
  } ConduitErrorCode;

  // Matches conduit::core::platform::PlatformFamily
  typedef enum ConduitPlatformFamily {
    CONDUIT_PLATFORM_UNKNOWN   = 0,
    CONDUIT_PLATFORM_LINUX     = 1,
    CONDUIT_PLATFORM_WINDOWS   = 2,
    CONDUIT_PLATFORM_MACOS     = 3,
    CONDUIT_PLATFORM_FREEBSD   = 4,
    CONDUIT_PLATFORM_NETBSD    = 5,
    CONDUIT_PLATFORM_OPENBSD   = 6,
    CONDUIT_PLATFORM_DRAGONFLY = 7,
    CONDUIT_PLATFORM_HAIKU     = 8,
  } ConduitPlatformFamily;

  // Matches conduit::utils::logging::LogLevel
  typedef enum ConduitLogLevel {
    CONDUIT_LOG_TRACE = 0,
    CONDUIT_LOG_DEBUG = 1,
    CONDUIT_LOG_INFO  = 2,
    CONDUIT_LOG_WARN  = 3,
    CONDUIT_LOG_ERROR = 4,
  } ConduitLogLevel;

  typedef enum ConduitSignal {
    CONDUIT_SIGNAL_TERMINATE = 0,
    CONDUIT_SIGNAL_INTERRUPT = 1,
    CONDUIT_SIGNAL_KILL      = 2,
    CONDUIT_SIGNAL_CUSTOM    = 3, // Raw POSIX signal number, see ConduitSignalProcessCustom
  } ConduitSignal;

  typedef struct ConduitPlatformInfo {
    ConduitPlatformFamily family;
    char*                 familyName;
    char*                 release;
    uint32_t              versionMajor;
    uint32_t              versionMinor;
    uint32_t              versionPatch;
    char*                 architecture;
    uint16_t              capabilities; // Bit set of conduit::core::platform::Capability
  } ConduitPlatformInfo;

  typedef struct ConduitExitStatus {
    int32_t       code;
    bool          terminatedBySignal;
    ConduitSignal signal;       // Only meaningful when terminatedBySignal is set
    int32_t       signalNumber; // POSIX signal number when signal is CONDUIT_SIGNAL_CUSTOM, otherwise 0
  } ConduitExitStatus;

  /**
   * Creates a context, loading configuration from configPath,
   * or from the default location when configPath is NULL.
   * The context's logger is installed as the process-wide log destination.
   * Returns NULL on failure; ConduitLastError() describes why.
   * Must be destroyed with ConduitDestroyContext.
   */
  CONDUIT_C_API ConduitContext* ConduitCreateContext(const char* configPath);

  /**
   * Destroys a context. Processes spawned from it must be destroyed first.
   */
  CONDUIT_C_API void ConduitDestroyContext(ConduitContext* ctx);

  /**
   * Message of the last error raised on the calling thread, or an empty string.
   * Valid until the next call into the library on the same thread.
   */
  CONDUIT_C_API const char* ConduitLastError(void);

  /**
   * Frees a string allocated by the library.
   */
  CONDUIT_C_API void ConduitFreeString(char* str);

  /**
   * Frees a buffer returned by ConduitReadFile.
   */
  CONDUIT_C_API void ConduitFreeBuffer(uint8_t* buffer);

  /**
   * Frees the strings inside a ConduitPlatformInfo, not the struct itself.
   */
  CONDUIT_C_API void ConduitFreePlatformInfo(ConduitPlatformInfo* info);

  CONDUIT_C_API ConduitErrorCode ConduitGetPlatform(const ConduitContext* ctx, ConduitPlatformInfo* out_info);

  // Paths are logical ('/'-separated) paths

  /**
   * Reads a whole file. The buffer must be freed with ConduitFreeBuffer.
   */
  CONDUIT_C_API ConduitErrorCode ConduitReadFile(const ConduitContext* ctx, const char* path, uint8_t** out_data, size_t* out_size);

  /**
   * Creates or truncates a file and writes size bytes to it.
   */
  CONDUIT_C_API ConduitErrorCode ConduitWriteFile(const ConduitContext* ctx, const char* path, const uint8_t* data, size_t size);

  CONDUIT_C_API ConduitErrorCode ConduitRemoveFile(const ConduitContext* ctx, const char* path);

  /**
   * Starts a child process. args may be NULL when argc is 0.
   * The handle must be destroyed with ConduitDestroyProcess.
   */
  CONDUIT_C_API ConduitErrorCode ConduitSpawnProcess(
    const ConduitContext* ctx,
    const char*           command,
    const char* const*    args,
    size_t                argc,
    ConduitProcess**      out_process
  );

  CONDUIT_C_API int64_t ConduitProcessId(const ConduitProcess* process);

  /**
   * Waits for the child to exit. A negative timeoutMs waits indefinitely.
   */
  CONDUIT_C_API ConduitErrorCode ConduitWaitProcess(ConduitProcess* process, int64_t timeoutMs, ConduitExitStatus* out_status);

  CONDUIT_C_API ConduitErrorCode ConduitSignalProcess(ConduitProcess* process, ConduitSignal signal);

  /**
   * Sends a raw POSIX signal number. Unsupported on Windows.
   */
  CONDUIT_C_API ConduitErrorCode ConduitSignalProcessCustom(ConduitProcess* process, int32_t number);

  /**
   * Releases the handle. A child that is still running is left running.
   */
  CONDUIT_C_API void ConduitDestroyProcess(ConduitProcess* process);

  /**
   * Writes a message through the context's logger.
   */
  CONDUIT_C_API ConduitErrorCode ConduitLog(const ConduitContext* ctx, ConduitLogLevel level, const char* message);
#ifdef __cplusplus
}
#endif

#endif // CONDUIT_C_H
