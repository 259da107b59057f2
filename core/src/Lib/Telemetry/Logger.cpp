#include <cerrno>                    // errno
#include <chrono>                    // std::chrono::{floor, milliseconds}
#include <glaze/core/meta.hpp>       // glz::meta
#include <glaze/json/write.hpp>      // glz::{write_json, format_error}
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Conduit++/Core/Dispatch.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Files/Path.hpp>
#include <Conduit++/Telemetry/Logger.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

#include "Telemetry/TelemetryBackend.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::config::LogFormat;
using conduit::config::SinkKind;
using conduit::core::Dispatch;
using conduit::core::capability::BackendId;
using conduit::utils::logging::LogEntry;
using conduit::utils::logging::LogLevel;

namespace logging = conduit::utils::logging;
namespace ops     = conduit::core::ops;

namespace {
  struct JsonEntry {
    String              timestamp;
    String              level;
    String              target;
    String              message;
    Map<String, String> fields;
  };

  constexpr StringView DefaultIdent = "conduit";

  auto LevelName(const LogLevel level) -> String {
    String name(magic_enum::enum_name(level));

    for (char& chr : name)
      if (chr >= 'A' && chr <= 'Z')
        chr = static_cast<char>(chr - 'A' + 'a');

    return name;
  }

  /**
   * @brief `target: message, k=v` without timestamp or level; the native log records both itself.
   */
  auto FormatNative(const LogEntry& entry) -> String {
    String line;

    if (!entry.target.empty()) {
      line += entry.target;
      line += ": ";
    }

    line += entry.message;

    if (!entry.fields.empty()) {
      line += ", ";
      line += logging::FormatFields(entry.fields, false);
    }

    return line;
  }

  auto ReportSinkFailure(const conduit::utils::error::ConduitError& error) -> void {
    const String line = std::format("conduit: log sink failed: {}\n", error);

    const LockGuard lock(logging::GetLogMutex());
    logging::WriteToConsole(line, true);
  }

  // Set while a thread is inside Logger::route, so a sink that itself logs
  // goes straight to the console instead of recursing.
  thread_local bool Routing = false;

  struct RoutingScope {
    RoutingScope() {
      Routing = true;
    }

    RoutingScope(const RoutingScope&)                    = delete;
    RoutingScope(RoutingScope&&)                         = delete;
    auto operator=(const RoutingScope&) -> RoutingScope& = delete;
    auto operator=(RoutingScope&&) -> RoutingScope&      = delete;

    ~RoutingScope() {
      Routing = false;
    }
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<JsonEntry> {
  using T                     = JsonEntry;
  static constexpr auto value = object(
    "timestamp",
    &T::timestamp,
    "level",
    &T::level,
    "target",
    &T::target,
    "message",
    &T::message,
    "fields",
    &T::fields
  );
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace conduit::telemetry {
  auto FormatStructured(const LogEntry& entry) -> Result<String> {
    JsonEntry json {
      .timestamp = std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(entry.timestamp)),
      .level     = LevelName(entry.level),
      .target    = entry.target,
      .message   = entry.message,
      .fields    = {},
    };

    for (const logging::Field& fieldEntry : entry.fields)
      json.fields.insert_or_assign(fieldEntry.key, fieldEntry.value);

    String buffer;

    if (const glz::error_ctx errc = glz::write_json(json, buffer))
      ERR_FMT(PlatformError, "Failed to serialize log entry: {}", glz::format_error(errc, buffer));

    return buffer;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // ConsoleSink
  // ─────────────────────────────────────────────────────────────────────────────

  ConsoleSink::ConsoleSink(const LogLevel minLevel, const LogFormat format, const bool colored)
    : LogSink(minLevel), m_format(format), m_colored(colored) {}

  auto ConsoleSink::write(const LogEntry& entry) -> Result<> {
    String line;

    if (m_format == LogFormat::Structured) {
      line = TRY(FormatStructured(entry));
      line += '\n';
    } else
      line = logging::FormatText(entry, m_colored);

    const LockGuard lock(logging::GetLogMutex());
    logging::WriteToConsole(line, logging::ShouldUseStderr(entry.level));

    return {};
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // FileSink
  // ─────────────────────────────────────────────────────────────────────────────

  FileSink::FileSink(OpenToken, std::ofstream stream, String path, const LogLevel minLevel, const LogFormat format)
    : LogSink(minLevel), m_stream(std::move(stream)), m_path(std::move(path)), m_format(format) {}

  auto FileSink::open(const core::Context& ctx, const StringView path, const LogLevel minLevel, const LogFormat format)
    -> Result<UniquePointer<FileSink>> {
    if (path.empty())
      ERR(InvalidArgument, "File sink needs a destination path");

    const String native = TRY(files::path::ToNative(path, ctx.profile().family));

    errno = 0;
    std::ofstream stream(native, std::ios::out | std::ios::app);

    if (!stream.is_open())
      ERR_ERRNO("Failed to open log file '{}'", path);

    return std::make_unique<FileSink>(OpenToken {}, std::move(stream), String(path), minLevel, format);
  }

  auto FileSink::write(const LogEntry& entry) -> Result<> {
    if (m_format == LogFormat::Structured) {
      const String json = TRY(FormatStructured(entry));
      m_stream << json << '\n';
    } else
      m_stream << logging::FormatText(entry, false);

    if (!m_stream)
      ERR_FMT(PlatformError, "Failed to write to log file '{}'", m_path);

    return {};
  }

  auto FileSink::flush() -> Result<> {
    m_stream.flush();

    if (!m_stream)
      ERR_FMT(PlatformError, "Failed to flush log file '{}'", m_path);

    return {};
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // NativeSink
  // ─────────────────────────────────────────────────────────────────────────────

  NativeSink::NativeSink(OpenToken, String ident, const LogLevel minLevel) : LogSink(minLevel), m_ident(std::move(ident)) {}

  auto NativeSink::open(const core::Context& ctx, const StringView ident, const LogLevel minLevel) -> Result<UniquePointer<NativeSink>> {
    auto sink = std::make_unique<NativeSink>(OpenToken {}, String(ident.empty() ? DefaultIdent : ident), minLevel);

    using Opened = Pair<NativeLogBackend*, isize>;

    const auto [backend, handle] = TRY(Dispatch<Opened>(
      ctx,
      ops::LogNative,
      {
        .native = [&](const BackendId id) -> Result<Opened> {
          NativeLogBackend* native = TRY(GetNativeLogBackend(id));
          const isize       opened = TRY(native->open(sink->m_ident));

          return Opened(native, opened);
        },
        .emulate = nullptr,
        .noop    = [] -> Result<Opened> { return Opened(nullptr, -1); },
      }
    ));

    sink->m_backend = backend;
    sink->m_handle  = handle;

    if (backend == nullptr)
      debug_log("Native log is unavailable; entries for '{}' will be dropped", sink->m_ident);

    return sink;
  }

  NativeSink::~NativeSink() {
    if (m_backend == nullptr)
      return;

    if (Result<> closed = m_backend->close(m_handle); !closed)
      ReportSinkFailure(closed.error());
  }

  auto NativeSink::write(const LogEntry& entry) -> Result<> {
    if (m_backend == nullptr)
      return {};

    return m_backend->write(m_handle, entry.level, FormatNative(entry));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Logger
  // ─────────────────────────────────────────────────────────────────────────────

  Logger::InstallGuard::InstallGuard(logging::LogRouter* router) : m_router(router) {
    logging::InstallLogRouter(m_router);
  }

  Logger::InstallGuard::InstallGuard(InstallGuard&& other) noexcept
    : m_router(other.m_router), m_active(std::exchange(other.m_active, false)) {}

  Logger::InstallGuard::~InstallGuard() {
    if (m_active)
      logging::UninstallLogRouter(m_router);
  }

  auto Logger::create(const core::Context& ctx) -> Result<UniquePointer<Logger>> {
    auto logger = std::make_unique<Logger>();

    const Vec<config::SinkConfig>& sinks = ctx.config().logSinks;

    if (sinks.empty()) {
      logger->addSink(std::make_unique<ConsoleSink>(ctx.config().logLevel, LogFormat::Text));
      return logger;
    }

    for (const config::SinkConfig& sink : sinks) {
      switch (sink.kind) {
        case SinkKind::Console: logger->addSink(std::make_unique<ConsoleSink>(sink.minLevel, sink.format)); break;
        case SinkKind::File:    logger->addSink(TRY(FileSink::open(ctx, sink.destination, sink.minLevel, sink.format))); break;
        case SinkKind::Native:  logger->addSink(TRY(NativeSink::open(ctx, sink.destination, sink.minLevel))); break;
      }
    }

    debug_log("Logger created with {} sink(s)", logger->sinkCount());
    return logger;
  }

  auto Logger::addSink(UniquePointer<LogSink> sink) -> void {
    const LockGuard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
  }

  auto Logger::sinkCount() const -> usize {
    const LockGuard lock(m_mutex);
    return m_sinks.size();
  }

  auto Logger::log(const LogLevel level, const StringView message, Vec<logging::Field> fields, const std::source_location& loc) -> void {
    route(LogEntry {
      .level     = level,
      .message   = String(message),
      .fields    = std::move(fields),
      .timestamp = std::chrono::system_clock::now(),
      .target    = {},
      .location  = loc,
    });
  }

  auto Logger::route(const LogEntry& entry) -> void {
    if (Routing) {
      const String line = logging::FormatText(entry, false);

      const LockGuard lock(logging::GetLogMutex());
      logging::WriteToConsole(line, true);
      return;
    }

    const RoutingScope scope;
    const LockGuard    lock(m_mutex);

    for (const UniquePointer<LogSink>& sink : m_sinks) {
      if (!sink->accepts(entry.level))
        continue;

      if (Result<> written = sink->write(entry); !written)
        ReportSinkFailure(written.error());
    }
  }

  auto Logger::flush() -> Result<> {
    const LockGuard lock(m_mutex);

    for (const UniquePointer<LogSink>& sink : m_sinks)
      TRY_VOID(sink->flush());

    return {};
  }

  auto Logger::install() -> InstallGuard {
    return InstallGuard(this);
  }
} // namespace conduit::telemetry
