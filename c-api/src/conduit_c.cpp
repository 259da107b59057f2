#include "../include/conduit_c.h"

#include <cstring>                   // std::memcpy
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Conduit++/Core/Config.hpp>
#include <Conduit++/Core/Context.hpp>
#include <Conduit++/Core/Platform.hpp>
#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Process/Process.hpp>
#include <Conduit++/Telemetry/Logger.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Types.hpp>

using namespace conduit::utils::types;
using conduit::config::Config;
using conduit::core::Context;
using conduit::files::FileSystem;
using conduit::process::ExitStatus;
using conduit::process::Process;
using conduit::process::ProcessManager;
using conduit::process::Signal;
using conduit::process::SignalKind;
using conduit::process::SpawnOptions;
using conduit::telemetry::Logger;
using conduit::utils::error::ConduitError;
using conduit::utils::logging::LogLevel;

namespace platform = conduit::core::platform;

// Convert C++ ErrorKind to C ConduitErrorCode enum value
#define TO_C_ERROR(err) static_cast<::ConduitErrorCode>(static_cast<u8>((err).kind))

namespace {
  thread_local String LastError;

  auto DupString(const StringView str) -> CStr* {
    CStr* result = new CStr[str.size() + 1];
    std::memcpy(result, str.data(), str.size());
    result[str.size()] = '\0';
    return result;
  }

  auto Fail(const ConduitError& err) -> ConduitErrorCode {
    LastError = err.message;
    return TO_C_ERROR(err);
  }

  auto FailInvalid(const StringView what) -> ConduitErrorCode {
    LastError = String(what);
    return CONDUIT_ERROR_INVALID_ARGUMENT;
  }
} // namespace

struct ConduitContext {
  UniquePointer<Context> context;
  UniquePointer<Logger>  logger;
  Logger::InstallGuard   guard;
};

struct ConduitProcess {
  Process inner;
};

extern "C" {
  auto ConduitCreateContext(PCStr configPath) -> ConduitContext* {
    Result<Config> config = configPath ? Config::load(configPath) : Config::loadDefault();

    if (!config) {
      LastError = config.error().message;
      return nullptr;
    }

    Result<UniquePointer<Context>> context = Context::create(std::move(*config));

    if (!context) {
      LastError = context.error().message;
      return nullptr;
    }

    Result<UniquePointer<Logger>> logger = Logger::create(**context);

    if (!logger) {
      LastError = logger.error().message;
      return nullptr;
    }

    Logger::InstallGuard guard = (*logger)->install();

    return new ConduitContext { .context = std::move(*context), .logger = std::move(*logger), .guard = std::move(guard) };
  }

  auto ConduitDestroyContext(ConduitContext* ctx) -> void {
    delete ctx;
  }

  auto ConduitLastError(void) -> PCStr {
    return LastError.c_str();
  }

  auto ConduitFreeString(CStr* str) -> void {
    delete[] str;
  }

  auto ConduitFreeBuffer(uint8_t* buffer) -> void {
    delete[] buffer;
  }

  auto ConduitFreePlatformInfo(ConduitPlatformInfo* info) -> void {
    if (!info)
      return;

    delete[] info->familyName;
    delete[] info->release;
    delete[] info->architecture;
    info->familyName   = nullptr;
    info->release      = nullptr;
    info->architecture = nullptr;
  }

  auto ConduitGetPlatform(const ConduitContext* ctx, ConduitPlatformInfo* out_info) -> ConduitErrorCode {
    if (!ctx || !out_info)
      return FailInvalid("ctx and out_info must not be NULL");

    const platform::PlatformProfile& profile = ctx->context->profile();

    out_info->family       = static_cast<ConduitPlatformFamily>(static_cast<u8>(profile.family));
    out_info->familyName   = DupString(platform::FamilyName(profile.family));
    out_info->release      = DupString(profile.release);
    out_info->versionMajor = profile.version.major;
    out_info->versionMinor = profile.version.minor;
    out_info->versionPatch = profile.version.patch;
    out_info->architecture = DupString(magic_enum::enum_name(profile.architecture));
    out_info->capabilities = static_cast<uint16_t>(profile.capabilities);

    return CONDUIT_SUCCESS;
  }

  auto ConduitReadFile(const ConduitContext* ctx, PCStr path, uint8_t** out_data, size_t* out_size) -> ConduitErrorCode {
    if (!ctx || !path || !out_data || !out_size)
      return FailInvalid("ctx, path, out_data and out_size must not be NULL");

    *out_data = nullptr;
    *out_size = 0;

    FileSystem fs(*ctx->context);

    Result<Bytes> result = fs.readFile(path);

    if (!result)
      return Fail(result.error());

    auto* data = new uint8_t[result->empty() ? 1 : result->size()];
    std::memcpy(data, result->data(), result->size());

    *out_data = data;
    *out_size = result->size();

    return CONDUIT_SUCCESS;
  }

  auto ConduitWriteFile(const ConduitContext* ctx, PCStr path, const uint8_t* data, const size_t size) -> ConduitErrorCode {
    if (!ctx || !path || (!data && size > 0))
      return FailInvalid("ctx and path must not be NULL, nor data when size is non-zero");

    FileSystem fs(*ctx->context);

    if (Result<> result = fs.writeFile(path, Span<const u8>(data, size)); !result)
      return Fail(result.error());

    return CONDUIT_SUCCESS;
  }

  auto ConduitRemoveFile(const ConduitContext* ctx, PCStr path) -> ConduitErrorCode {
    if (!ctx || !path)
      return FailInvalid("ctx and path must not be NULL");

    FileSystem fs(*ctx->context);

    if (Result<> result = fs.remove(path); !result)
      return Fail(result.error());

    return CONDUIT_SUCCESS;
  }

  auto ConduitSpawnProcess(const ConduitContext* ctx, PCStr command, const char* const* args, const size_t argc, ConduitProcess** out_process) -> ConduitErrorCode {
    if (!ctx || !command || !out_process || (!args && argc > 0))
      return FailInvalid("ctx, command and out_process must not be NULL, nor args when argc is non-zero");

    *out_process = nullptr;

    SpawnOptions options { .command = command };

    for (const PCStr arg : Span<const char* const>(args, argc)) {
      if (!arg)
        return FailInvalid("args must not contain NULL entries");

      options.args.emplace_back(arg);
    }

    ProcessManager manager(*ctx->context);

    Result<Process> process = manager.spawn(options);

    if (!process)
      return Fail(process.error());

    *out_process = new ConduitProcess { .inner = std::move(*process) };

    return CONDUIT_SUCCESS;
  }

  auto ConduitProcessId(const ConduitProcess* process) -> int64_t {
    return process ? process->inner.pid() : -1;
  }

  auto ConduitWaitProcess(ConduitProcess* process, const int64_t timeoutMs, ConduitExitStatus* out_status) -> ConduitErrorCode {
    if (!process || !out_status)
      return FailInvalid("process and out_status must not be NULL");

    const Option<Millis> timeout = timeoutMs < 0 ? None : Option<Millis>(Millis(timeoutMs));

    Result<ExitStatus> status = process->inner.wait(timeout);

    if (!status)
      return Fail(status.error());

    out_status->code               = status->code;
    out_status->terminatedBySignal = status->terminatedBySignal.has_value();
    out_status->signal             = CONDUIT_SIGNAL_TERMINATE;
    out_status->signalNumber       = 0;

    if (status->terminatedBySignal) {
      switch (status->terminatedBySignal->kind) {
        case SignalKind::Terminate: out_status->signal = CONDUIT_SIGNAL_TERMINATE; break;
        case SignalKind::Interrupt: out_status->signal = CONDUIT_SIGNAL_INTERRUPT; break;
        case SignalKind::Kill:      out_status->signal = CONDUIT_SIGNAL_KILL; break;
        case SignalKind::Custom:
          out_status->signal       = CONDUIT_SIGNAL_CUSTOM;
          out_status->signalNumber = status->terminatedBySignal->number;
          break;
      }
    }

    return CONDUIT_SUCCESS;
  }

  auto ConduitSignalProcess(ConduitProcess* process, const ConduitSignal signal) -> ConduitErrorCode {
    if (!process)
      return FailInvalid("process must not be NULL");

    Signal target;

    switch (signal) {
      case CONDUIT_SIGNAL_TERMINATE: target = Signal::terminate(); break;
      case CONDUIT_SIGNAL_INTERRUPT: target = Signal::interrupt(); break;
      case CONDUIT_SIGNAL_KILL:      target = Signal::kill(); break;
      case CONDUIT_SIGNAL_CUSTOM:    return FailInvalid("Custom signals need a number; use ConduitSignalProcessCustom");
      default:                       return FailInvalid("Unknown signal");
    }

    if (Result<> result = process->inner.signal(target); !result)
      return Fail(result.error());

    return CONDUIT_SUCCESS;
  }

  auto ConduitSignalProcessCustom(ConduitProcess* process, const int32_t number) -> ConduitErrorCode {
    if (!process)
      return FailInvalid("process must not be NULL");

    if (Result<> result = process->inner.signal(Signal::custom(number)); !result)
      return Fail(result.error());

    return CONDUIT_SUCCESS;
  }

  auto ConduitDestroyProcess(ConduitProcess* process) -> void {
    delete process;
  }

  auto ConduitLog(const ConduitContext* ctx, const ConduitLogLevel level, PCStr message) -> ConduitErrorCode {
    if (!ctx || !message)
      return FailInvalid("ctx and message must not be NULL");

    if (level < CONDUIT_LOG_TRACE || level > CONDUIT_LOG_ERROR)
      return FailInvalid("Unknown log level");

    ctx->logger->log(static_cast<LogLevel>(level), message);

    return CONDUIT_SUCCESS;
  }
}
