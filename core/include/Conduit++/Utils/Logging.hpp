#pragma once

#include <algorithm>    // std::{copy_n, find}
#include <atomic>       // std::atomic
#include <chrono>       // std::chrono::system_clock
#include <ctime>        // localtime_r/s, strftime, time_t, tm
#include <filesystem>   // std::filesystem::path
#include <format>       // std::format
#include <iterator>     // std::next
#include <mutex>        // std::unique_lock
#include <shared_mutex> // std::{shared_mutex, shared_lock}
#include <utility>      // std::forward

#ifdef _WIN32
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <windows.h>
#endif

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace conduit::utils::logging {
  namespace types = ::conduit::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes raw text to stdout or stderr, going through the console API on Windows.
   */
  inline auto WriteToConsole(const types::StringView text, const bool useStderr = false) -> void {
#ifdef _WIN32
    HANDLE hOutput = GetStdHandle(useStderr ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
    if (hOutput != INVALID_HANDLE_VALUE) {
      DWORD consoleMode = 0;
      if (GetConsoleMode(hOutput, &consoleMode))
        WriteConsoleA(hOutput, text.data(), static_cast<DWORD>(text.size()), nullptr, nullptr);
      else
        WriteFile(hOutput, text.data(), static_cast<DWORD>(text.size()), nullptr, nullptr);
      return;
    }
#endif

#ifdef __cpp_lib_print
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
#else
    if (useStderr)
      std::cerr << text;
    else
      std::cout << text;
#endif
  }

  enum class LogColor : types::u8 {
    Black   = 0,
    Red     = 1,
    Green   = 2,
    Yellow  = 3,
    Blue    = 4,
    Magenta = 5,
    Cyan    = 6,
    White   = 7,
    Gray    = 8,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 9> COLOR_CODE_LITERALS = {
      "\033[38;5;0m", "\033[38;5;1m", "\033[38;5;2m",
      "\033[38;5;3m", "\033[38;5;4m", "\033[38;5;5m",
      "\033[38;5;6m", "\033[38;5;7m", "\033[38;5;8m",
    };
    // clang-format on

    static constexpr types::PCStr RESET_CODE   = "\033[0m";
    static constexpr types::PCStr BOLD_START   = "\033[1m";
    static constexpr types::PCStr ITALIC_START = "\033[3m";
    static constexpr types::PCStr DIM_START    = "\033[2m";

    // TRACE=magenta, DEBUG=blue, INFO=green, WARN=yellow, ERROR=red
    static constexpr types::Array<types::StringView, 5> STYLED_LEVELS = {
      "\033[1m\033[38;5;5mTRACE\033[0m",
      "\033[1m\033[38;5;4mDEBUG\033[0m",
      "\033[1m\033[38;5;2mINFO \033[0m",
      "\033[1m\033[38;5;3mWARN \033[0m",
      "\033[1m\033[38;5;1mERROR\033[0m",
    };

    static constexpr types::Array<types::StringView, 5> PLAIN_LEVELS = { "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR" };

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Severity of a log entry, ordered from most to least verbose.
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  inline auto GetRuntimeLogLevelStorage() -> std::atomic<LogLevel>& {
    static std::atomic<LogLevel> Level = LogLevel::Info;
    return Level;
  }

  /**
   * @brief Threshold below which internal diagnostics are dropped before formatting.
   */
  inline auto GetRuntimeLogLevel() -> LogLevel {
    return GetRuntimeLogLevelStorage().load(std::memory_order_relaxed);
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLogLevelStorage().store(level, std::memory_order_relaxed);
  }

  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  /**
   * @brief Wraps text in ANSI escape codes for the given style.
   */
  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 24);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  /**
   * @brief Returns an ISO8601-like local timestamp (YYYY-MM-DDTHH:MM:SS).
   *
   * The formatted second is cached per thread; consecutive entries in the same
   * second reuse the buffer.
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (
#ifdef _WIN32
        localtime_s(&localTm, &timeT) == 0
#else
        localtime_r(&timeT, &localTm) != nullptr
#endif
      ) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  /**
   * @struct Field
   * @brief A key/value pair attached to a structured log entry.
   */
  struct Field {
    types::String key;
    types::String value;

    template <typename T>
    static auto create(types::StringView k, const T& v) -> Field {
      using Decayed = std::decay_t<T>;

      if constexpr (std::is_same_v<Decayed, types::String> || std::is_same_v<Decayed, types::StringView> ||
                    std::is_same_v<Decayed, const char*> || std::is_same_v<Decayed, char*>)
        return Field { types::String(k), types::String(v) };
      else if constexpr (std::is_same_v<Decayed, bool>)
        return Field { types::String(k), v ? "true" : "false" };
      else
        return Field { types::String(k), std::format("{}", v) };
    }

    auto operator==(const Field&) const -> bool = default;
  };

  /**
   * @struct LogEntry
   * @brief One structured log record: {level, message, fields, timestamp} plus origin.
   */
  struct LogEntry {
    LogLevel             level = LogLevel::Info;
    types::String        message;
    types::Vec<Field>    fields;
    types::Timestamp     timestamp;
    types::String        target;
    std::source_location location;
  };

  /**
   * @brief Formats fields as `key=value, key2=value2`.
   */
  inline auto FormatFields(const types::Vec<Field>& fields, const bool colored) -> types::String {
    types::String result;

    for (types::usize i = 0; i < fields.size(); ++i) {
      if (i > 0)
        result += ", ";
      result += colored ? Stylize(fields[i].key, { .bold = true }) : fields[i].key;
      result += '=';
      result += fields[i].value;
    }

    return result;
  }

  /**
   * @brief Renders an entry in the compact text layout: `timestamp LEVEL target: message, k=v`.
   */
  inline auto FormatText(const LogEntry& entry, const bool colored) -> types::String {
    const types::StringView timestamp = GetCachedTimestamp(std::chrono::system_clock::to_time_t(entry.timestamp));
    const auto              levelIdx  = static_cast<types::usize>(entry.level);

    types::String line;
    line.reserve(entry.message.size() + 64);

    line += colored ? Stylize(timestamp, { .color = LogColor::Gray, .dim = true }) : types::String(timestamp);
    line += ' ';
    line += colored ? LogLevelConst::STYLED_LEVELS.at(levelIdx) : LogLevelConst::PLAIN_LEVELS.at(levelIdx);
    line += ' ';

#ifndef NDEBUG
    if (colored) {
      line += Stylize(
        std::format("{}:{}", std::filesystem::path(entry.location.file_name()).filename().string(), entry.location.line()),
        { .color = LogColor::Gray, .italic = true }
      );
      line += ' ';
    }
#endif

    if (!entry.target.empty()) {
      line += colored ? Stylize(entry.target, { .bold = true }) : entry.target;
      line += ": ";
    }

    line += entry.message;

    if (!entry.fields.empty()) {
      line += ", ";
      line += FormatFields(entry.fields, colored);
    }

    line += '\n';
    return line;
  }

  /**
   * @class LogRouter
   * @brief Receives every internal log entry once a router is installed.
   *
   * The Logging Facade implements this to fan entries out to its configured
   * sinks. With no router installed, entries are printed to the console.
   */
  class LogRouter {
   public:
    LogRouter()                                    = default;
    LogRouter(const LogRouter&)                    = delete;
    LogRouter(LogRouter&&)                         = delete;
    auto operator=(const LogRouter&) -> LogRouter& = delete;
    auto operator=(LogRouter&&) -> LogRouter&      = delete;
    virtual ~LogRouter()                           = default;

    virtual auto route(const LogEntry& entry) -> void = 0;
  };

  struct LogRouterRegistry {
    std::shared_mutex      mutex;
    types::Vec<LogRouter*>        installed;
  };

  inline auto GetLogRouterRegistry() -> LogRouterRegistry& {
    static LogRouterRegistry Registry;
    return Registry;
  }

  // Set while this thread is inside a router, so a sink that logs goes to the console.
  inline thread_local bool InsideRouter = false;

  /**
   * @brief Makes router the destination of internal log entries until it is uninstalled.
   */
  inline auto InstallLogRouter(LogRouter* router) -> void {
    LogRouterRegistry&                        registry = GetLogRouterRegistry();
    const std::unique_lock<std::shared_mutex> lock(registry.mutex);

    registry.installed.push_back(router);
  }

  /**
   * @brief Removes the most recent installation of router, in any order relative to other routers.
   *
   * Blocks until no thread is routing, so the router can be destroyed once this returns.
   */
  inline auto UninstallLogRouter(LogRouter* router) -> void {
    LogRouterRegistry&                        registry = GetLogRouterRegistry();
    const std::unique_lock<std::shared_mutex> lock(registry.mutex);

    types::Vec<LogRouter*>& installed = registry.installed;

    if (const auto found = std::find(installed.rbegin(), installed.rend(), router); found != installed.rend())
      installed.erase(std::next(found).base());
  }

  /**
   * @brief The router currently receiving entries, or null when entries go to the console.
   */
  inline auto ActiveLogRouter() -> LogRouter* {
    LogRouterRegistry&                        registry = GetLogRouterRegistry();
    const std::shared_lock<std::shared_mutex> lock(registry.mutex);

    return registry.installed.empty() ? nullptr : registry.installed.back();
  }

  /**
   * @brief Sends an entry to the most recently installed router, or to the console when none is installed.
   */
  inline auto Dispatch(const LogEntry& entry) -> void {
    if (!InsideRouter) {
      LogRouterRegistry&                        registry = GetLogRouterRegistry();
      const std::shared_lock<std::shared_mutex> lock(registry.mutex);

      if (!registry.installed.empty()) {
        InsideRouter = true;
        registry.installed.back()->route(entry);
        InsideRouter = false;
        return;
      }
    }

    const types::String line = FormatText(entry, true);

    const types::LockGuard lock(GetLogMutex());
    WriteToConsole(line, ShouldUseStderr(entry.level));
  }

  /**
   * @brief Converts a compiler function name into a module-like target.
   * @details "auto conduit::files::FileSystem::open(...)" becomes "conduit::files::FileSystem".
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    const types::StringView func(funcName);

    types::usize parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    const types::usize lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    const types::usize spacePos = func.rfind(' ', lastColonPos);
    const types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  /**
   * @brief Collects fields for the `*_log_fields` macros.
   */
  template <typename... Fs>
  auto Fields(Fs&&... fields) -> types::Vec<Field> {
    types::Vec<Field> out;
    out.reserve(sizeof...(Fs));
    (out.push_back(std::forward<Fs>(fields)), ...);
    return out;
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    types::String               target,
    types::Vec<Field>           fields,
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> void {
    if (level < GetRuntimeLogLevel())
      return;

    Dispatch(LogEntry {
      .level     = level,
      .message   = std::format(fmt, std::forward<Args>(args)...),
      .fields    = std::move(fields),
      .timestamp = std::chrono::system_clock::now(),
      .target    = std::move(target),
      .location  = loc,
    });
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    types::String               target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> void {
    LogImpl(level, loc, std::move(target), types::Vec<Field> {}, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Logs a ConduitError (or any exception / object with a `message`) at its origin.
   */
  template <typename ErrorType>
  auto LogError(const LogLevel level, types::String target, const ErrorType& errorObj) -> void {
    using Decayed = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<Decayed, error::ConduitError>)
      LogImpl(level, errorObj.location, std::move(target), "{}", errorObj);
    else if constexpr (std::is_base_of_v<std::exception, Decayed>)
      LogImpl(level, std::source_location::current(), std::move(target), "{}", errorObj.what());
    else
      LogImpl(level, std::source_location::current(), std::move(target), "{}", errorObj.message);
  }
} // namespace conduit::utils::logging

#define CONDUIT_LOG_TARGET ::conduit::utils::logging::ExtractTarget(std::source_location::current().function_name())

#define field(name, value) ::conduit::utils::logging::Field::create(#name, value)

#define CONDUIT_LOG(level, fmt, ...)       \
  ::conduit::utils::logging::LogImpl(      \
    ::conduit::utils::logging::LogLevel::level, \
    std::source_location::current(),      \
    CONDUIT_LOG_TARGET,                    \
    fmt __VA_OPT__(, ) __VA_ARGS__         \
  )

#define CONDUIT_LOG_FIELDS(level, fields_vec, fmt, ...) \
  ::conduit::utils::logging::LogImpl(                   \
    ::conduit::utils::logging::LogLevel::level,         \
    std::source_location::current(),                    \
    CONDUIT_LOG_TARGET,                                 \
    fields_vec,                                         \
    fmt __VA_OPT__(, ) __VA_ARGS__                      \
  )

#define trace_log(fmt, ...) CONDUIT_LOG(Trace, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log(fmt, ...) CONDUIT_LOG(Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...)  CONDUIT_LOG(Info, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...)  CONDUIT_LOG(Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) CONDUIT_LOG(Error, fmt __VA_OPT__(, ) __VA_ARGS__)

// Usage: debug_log_fields(Fields(field(pid, pid), field(cwd, dir)), "spawned {}", name);
#define trace_log_fields(fields_vec, fmt, ...) CONDUIT_LOG_FIELDS(Trace, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define debug_log_fields(fields_vec, fmt, ...) CONDUIT_LOG_FIELDS(Debug, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log_fields(fields_vec, fmt, ...)  CONDUIT_LOG_FIELDS(Info, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log_fields(fields_vec, fmt, ...)  CONDUIT_LOG_FIELDS(Warn, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log_fields(fields_vec, fmt, ...) CONDUIT_LOG_FIELDS(Error, fields_vec, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) \
  ::conduit::utils::logging::LogError(::conduit::utils::logging::LogLevel::Debug, CONDUIT_LOG_TARGET, error_obj)
#define warn_at(error_obj) \
  ::conduit::utils::logging::LogError(::conduit::utils::logging::LogLevel::Warn, CONDUIT_LOG_TARGET, error_obj)
#define error_at(error_obj) \
  ::conduit::utils::logging::LogError(::conduit::utils::logging::LogLevel::Error, CONDUIT_LOG_TARGET, error_obj)
