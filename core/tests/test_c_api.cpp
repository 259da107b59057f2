#include <boost/ut.hpp>

#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <string>

#include <conduit_c.h>

using namespace boost::ut;

namespace {
  auto ScratchFile() -> std::string {
    return std::format(
      "{}/conduit-c-api-{}.bin",
      std::filesystem::temp_directory_path().generic_string(),
      std::chrono::steady_clock::now().time_since_epoch().count()
    );
  }
} // namespace

auto main() -> int {
  ConduitContext* ctx = ConduitCreateContext(nullptr);

  if (ctx == nullptr)
    return 1;

  "Platform info describes the host"_test = [&] -> void {
    ConduitPlatformInfo info {};

    expect(ConduitGetPlatform(ctx, &info) == CONDUIT_SUCCESS);
    expect(info.familyName != nullptr && std::strlen(info.familyName) > 0);
    expect(info.release != nullptr);
    expect(info.architecture != nullptr);

#ifdef __linux__
    expect(info.family == CONDUIT_PLATFORM_LINUX);
    expect(std::string(info.familyName) == "Linux");
#endif

    ConduitFreePlatformInfo(&info);
  };

  "Files round trip through the C surface"_test = [&] -> void {
    const std::string path    = ScratchFile();
    const std::string payload("conduit\0bytes", 13);

    expect(ConduitWriteFile(ctx, path.c_str(), reinterpret_cast<const uint8_t*>(payload.data()), payload.size()) == CONDUIT_SUCCESS);

    uint8_t* data = nullptr;
    size_t   size = 0;

    expect(ConduitReadFile(ctx, path.c_str(), &data, &size) == CONDUIT_SUCCESS);
    expect(size == payload.size());
    expect(data != nullptr && std::memcmp(data, payload.data(), size) == 0);

    ConduitFreeBuffer(data);

    expect(ConduitRemoveFile(ctx, path.c_str()) == CONDUIT_SUCCESS);
    expect(ConduitReadFile(ctx, path.c_str(), &data, &size) == CONDUIT_ERROR_NOT_FOUND);
    expect(data == nullptr && size == 0);
    expect(std::strlen(ConduitLastError()) > 0);
  };

  "NULL arguments are InvalidArgument"_test = [&] -> void {
    uint8_t* data = nullptr;
    size_t   size = 0;

    expect(ConduitReadFile(nullptr, "/tmp/x", &data, &size) == CONDUIT_ERROR_INVALID_ARGUMENT);
    expect(ConduitReadFile(ctx, nullptr, &data, &size) == CONDUIT_ERROR_INVALID_ARGUMENT);
    expect(ConduitGetPlatform(ctx, nullptr) == CONDUIT_ERROR_INVALID_ARGUMENT);
    expect(ConduitLog(ctx, CONDUIT_LOG_INFO, nullptr) == CONDUIT_ERROR_INVALID_ARGUMENT);
    expect(ConduitProcessId(nullptr) == -1);
  };

#ifndef _WIN32
  "Processes can be spawned and awaited"_test = [&] -> void {
    const char* const args[] = { "-c", "exit 4" };

    ConduitProcess* process = nullptr;

    expect(ConduitSpawnProcess(ctx, "/bin/sh", args, 2, &process) == CONDUIT_SUCCESS);
    if (process == nullptr)
      return;

    expect(ConduitProcessId(process) > 0);

    ConduitExitStatus status {};

    expect(ConduitWaitProcess(process, -1, &status) == CONDUIT_SUCCESS);
    expect(status.code == 4);
    expect(!status.terminatedBySignal);
    expect(status.signalNumber == 0);

    ConduitDestroyProcess(process);
  };

  "Waits time out and signals end the child"_test = [&] -> void {
    const char* const args[] = { "-c", "exec sleep 30" };

    ConduitProcess* process = nullptr;

    expect(ConduitSpawnProcess(ctx, "/bin/sh", args, 2, &process) == CONDUIT_SUCCESS);
    if (process == nullptr)
      return;

    ConduitExitStatus status {};

    expect(ConduitWaitProcess(process, 20, &status) == CONDUIT_ERROR_TIMEOUT);
    expect(ConduitSignalProcess(process, CONDUIT_SIGNAL_KILL) == CONDUIT_SUCCESS);
    expect(ConduitWaitProcess(process, -1, &status) == CONDUIT_SUCCESS);
    expect(status.terminatedBySignal);
    expect(status.signal == CONDUIT_SIGNAL_KILL);
    expect(status.code == 137);

    ConduitDestroyProcess(process);
  };

  "Exit status names custom signals"_test = [&] -> void {
    const char* const args[] = { "-c", "exec sleep 30" };

    ConduitProcess* process = nullptr;

    expect(ConduitSpawnProcess(ctx, "/bin/sh", args, 2, &process) == CONDUIT_SUCCESS);
    if (process == nullptr)
      return;

    expect(ConduitSignalProcess(process, CONDUIT_SIGNAL_CUSTOM) == CONDUIT_ERROR_INVALID_ARGUMENT);
    expect(ConduitSignalProcessCustom(process, SIGHUP) == CONDUIT_SUCCESS);

    ConduitExitStatus status {};

    expect(ConduitWaitProcess(process, -1, &status) == CONDUIT_SUCCESS);
    expect(status.terminatedBySignal);
    expect(status.signal == CONDUIT_SIGNAL_CUSTOM);
    expect(status.signalNumber == SIGHUP);
    expect(status.code == 128 + SIGHUP);

    ConduitDestroyProcess(process);
  };
#endif

  "Missing commands are NotFound"_test = [&] -> void {
    ConduitProcess* process = nullptr;

    expect(ConduitSpawnProcess(ctx, "conduit-no-such-command-4711", nullptr, 0, &process) == CONDUIT_ERROR_NOT_FOUND);
    expect(process == nullptr);
  };

  "Logging through the context"_test = [&] -> void {
    expect(ConduitLog(ctx, CONDUIT_LOG_DEBUG, "hello from C") == CONDUIT_SUCCESS);
  };

  "Contexts can be destroyed in creation order"_test = [] -> void {
    ConduitContext* first  = ConduitCreateContext(nullptr);
    ConduitContext* second = ConduitCreateContext(nullptr);

    expect(first != nullptr && second != nullptr);

    ConduitDestroyContext(first);
    expect(ConduitLog(second, CONDUIT_LOG_WARN, "first context released") == CONDUIT_SUCCESS);
    ConduitDestroyContext(second);

    ConduitContext* third = ConduitCreateContext(nullptr);

    expect(third != nullptr);
    expect(third == nullptr || ConduitLog(third, CONDUIT_LOG_DEBUG, "fresh context") == CONDUIT_SUCCESS);

    ConduitDestroyContext(third);
  };

  ConduitDestroyContext(ctx);

  return 0;
}
