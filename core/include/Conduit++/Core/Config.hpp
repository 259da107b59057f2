#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Capability.hpp"

namespace conduit::config {
  namespace types = ::conduit::utils::types;

  enum class SinkKind : types::u8 {
    Console,
    File,
    Native,
  };

  enum class LogFormat : types::u8 {
    Text,       ///< `timestamp LEVEL target: message, k=v`
    Structured, ///< One JSON object per line.
  };

  /**
   * @struct SinkConfig
   * @brief One configured log destination.
   */
  struct SinkConfig {
    SinkKind                    kind     = SinkKind::Console;
    types::String               destination; ///< File path (logical) for File, event source ident for Native.
    utils::logging::LogLevel    minLevel = utils::logging::LogLevel::Info;
    LogFormat                   format   = LogFormat::Text;

    auto operator==(const SinkConfig&) const -> bool = default;
  };

  /**
   * @struct Config
   * @brief Process-wide settings, loaded once at initialization.
   */
  struct Config {
    types::Vec<SinkConfig>                                         logSinks;
    utils::logging::LogLevel                                       logLevel          = utils::logging::LogLevel::Info;
    types::Millis                                                  telemetryInterval = types::Millis(1000);
    types::Map<types::String, core::capability::FallbackPolicy>    fallbackPolicyOverrides;

    /**
     * @brief Parses TOML text.
     * @return InvalidArgument on malformed TOML or unrecognized enumerated values.
     *
     * @code{.toml}
     * log_level = "debug"
     * telemetry_interval_ms = 500
     *
     * [[log_sinks]]
     * kind = "file"
     * destination = "/var/log/app.log"
     * min_level = "info"
     * format = "structured"
     *
     * [[fallback_overrides]]
     * operation = "file.remove_all"
     * policy = "emulate"
     * @endcode
     */
    static auto fromToml(types::StringView text) -> types::Result<Config>;

    /**
     * @brief Reads and parses a TOML file.
     * @return NotFound if the file does not exist; otherwise as fromToml.
     */
    static auto load(const std::filesystem::path& path) -> types::Result<Config>;

    /**
     * @brief Loads the first config file found on the search path, or defaults if none exists.
     */
    static auto loadDefault() -> types::Result<Config>;

    /**
     * @brief Returns the first existing file on the search path.
     *
     * Search order: $CONDUIT_CONFIG, $XDG_CONFIG_HOME/conduit/config.toml,
     * ~/.config/conduit/config.toml (%LOCALAPPDATA% and %APPDATA% on Windows),
     * ./conduit.toml.
     */
    static auto findConfigPath() -> types::Option<std::filesystem::path>;

    /**
     * @brief Serializes this configuration as TOML to `path`.
     */
    [[nodiscard]] auto save(const std::filesystem::path& path) const -> types::Result<>;
  };
} // namespace conduit::config
