#pragma once

#include <fstream> // std::ofstream

#include "../Core/Config.hpp"
#include "../Core/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"

namespace conduit::telemetry {
  namespace types   = ::conduit::utils::types;
  namespace logging = ::conduit::utils::logging;

  class NativeLogBackend;

  /**
   * @brief Renders an entry as a single-line JSON object:
   *        {"timestamp":..., "level":..., "target":..., "message":..., "fields":{...}}.
   */
  auto FormatStructured(const logging::LogEntry& entry) -> types::Result<types::String>;

  /**
   * @class LogSink
   * @brief A destination for log entries. Entries below minLevel() never reach write().
   */
  class LogSink {
   public:
    explicit LogSink(const logging::LogLevel minLevel) : m_minLevel(minLevel) {}

    LogSink(const LogSink&)                    = delete;
    LogSink(LogSink&&)                         = delete;
    auto operator=(const LogSink&) -> LogSink& = delete;
    auto operator=(LogSink&&) -> LogSink&      = delete;
    virtual ~LogSink()                         = default;

    virtual auto write(const logging::LogEntry& entry) -> types::Result<> = 0;

    virtual auto flush() -> types::Result<> {
      return {};
    }

    [[nodiscard]] auto minLevel() const -> logging::LogLevel {
      return m_minLevel;
    }

    [[nodiscard]] auto accepts(const logging::LogLevel level) const -> bool {
      return level >= m_minLevel;
    }

   private:
    logging::LogLevel m_minLevel;
  };

  /**
   * @class ConsoleSink
   * @brief Writes to stdout (stderr for Warn and Error), coloured text or JSON lines.
   */
  class ConsoleSink final : public LogSink {
   public:
    ConsoleSink(logging::LogLevel minLevel, config::LogFormat format, bool colored = true);

    auto write(const logging::LogEntry& entry) -> types::Result<> override;

   private:
    config::LogFormat m_format;
    bool              m_colored;
  };

  /**
   * @class FileSink
   * @brief Appends plain text or JSON lines to a file, creating it if needed.
   */
  class FileSink final : public LogSink {
    struct OpenToken {
      explicit OpenToken() = default;
    };

   public:
    /**
     * @param path  Logical path; parent directories must exist.
     */
    static auto open(const core::Context& ctx, types::StringView path, logging::LogLevel minLevel, config::LogFormat format)
      -> types::Result<types::UniquePointer<FileSink>>;

    /**
     * @brief Only reachable through open().
     */
    FileSink(OpenToken, std::ofstream stream, types::String path, logging::LogLevel minLevel, config::LogFormat format);

    auto write(const logging::LogEntry& entry) -> types::Result<> override;
    auto flush() -> types::Result<> override;

    [[nodiscard]] auto path() const -> const types::String& {
      return m_path;
    }

   private:
    std::ofstream     m_stream;
    types::String     m_path;
    config::LogFormat m_format;
  };

  /**
   * @class NativeSink
   * @brief Forwards entries to the platform log (syslog, Windows Event Log).
   *
   * Where no native log exists the "log.native" operation falls back to a
   * no-op: entries are accepted and dropped, which is observably different
   * from real delivery.
   */
  class NativeSink final : public LogSink {
    struct OpenToken {
      explicit OpenToken() = default;
    };

   public:
    /**
     * @param ident  Program identifier / event source name. Empty uses "conduit".
     */
    static auto open(const core::Context& ctx, types::StringView ident, logging::LogLevel minLevel)
      -> types::Result<types::UniquePointer<NativeSink>>;

    NativeSink(OpenToken, types::String ident, logging::LogLevel minLevel);

    NativeSink(const NativeSink&)                    = delete;
    NativeSink(NativeSink&&)                         = delete;
    auto operator=(const NativeSink&) -> NativeSink& = delete;
    auto operator=(NativeSink&&) -> NativeSink&      = delete;
    ~NativeSink() override;

    auto write(const logging::LogEntry& entry) -> types::Result<> override;

    /**
     * @brief False when entries are being dropped by the no-op fallback.
     */
    [[nodiscard]] auto isDelivering() const -> bool {
      return m_backend != nullptr;
    }

   private:
    NativeLogBackend* m_backend = nullptr;
    types::isize      m_handle  = -1;
    types::String     m_ident;
  };

  /**
   * @class Logger
   * @brief The logging facade: fans structured entries out to every configured sink.
   *
   * A Logger becomes the process-wide destination of the `*_log` macros while
   * an InstallGuard returned by install() is alive. Sink failures are reported
   * on stderr and never propagate into the code that logged.
   */
  class Logger final : public logging::LogRouter {
   public:
    /**
     * @brief Uninstalls the logger on destruction, whatever order other guards are released in.
     */
    class InstallGuard {
     public:
      InstallGuard(const InstallGuard&)                    = delete;
      InstallGuard(InstallGuard&& other) noexcept;
      auto operator=(const InstallGuard&) -> InstallGuard& = delete;
      auto operator=(InstallGuard&&) -> InstallGuard&      = delete;
      ~InstallGuard();

     private:
      friend class Logger;

      explicit InstallGuard(logging::LogRouter* router);

      logging::LogRouter* m_router;
      bool                m_active = true;
    };

    Logger() = default;

    /**
     * @brief Builds the sinks named by ctx.config().logSinks (a single console sink if none).
     * @return The first sink that fails to open.
     */
    static auto create(const core::Context& ctx) -> types::Result<types::UniquePointer<Logger>>;

    auto addSink(types::UniquePointer<LogSink> sink) -> void;

    [[nodiscard]] auto sinkCount() const -> types::usize;

    /**
     * @brief Logs directly through this logger, bypassing the runtime level threshold.
     */
    auto log(logging::LogLevel level, types::StringView message, types::Vec<logging::Field> fields = {}, const std::source_location& loc = std::source_location::current()) -> void;

    auto route(const logging::LogEntry& entry) -> void override;

    auto flush() -> types::Result<>;

    [[nodiscard]] auto install() -> InstallGuard;

   private:
    mutable types::Mutex                     m_mutex;
    types::Vec<types::UniquePointer<LogSink>> m_sinks;
  };
} // namespace conduit::telemetry
