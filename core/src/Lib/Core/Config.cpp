#include <filesystem>                // std::filesystem::{path, exists}
#include <glaze/toml.hpp>            // glz::{read, write_file_toml, file_to_buffer, format_error}
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, enum_name, case_insensitive}
#include <system_error>              // std::error_code

#include <Conduit++/Core/Config.hpp>
#include <Conduit++/Utils/Env.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::capability::FallbackPolicy;
using conduit::utils::env::GetEnv;
using conduit::utils::logging::LogLevel;

namespace fs = std::filesystem;

// glaze's TOML reader has no std::optional support, so absent strings are
// empty and absent numbers keep their defaults.
namespace {
  struct TomlSink {
    String kind = "console";
    String destination;
    String min_level = "info";
    String format    = "text";
  };

  struct TomlOverride {
    String operation;
    String policy;
  };

  struct TomlConfig {
    String            log_level             = "info";
    u64               telemetry_interval_ms = 1000;
    Vec<TomlSink>     log_sinks;
    Vec<TomlOverride> fallback_overrides;
  };

  template <typename Enum>
  auto ParseEnum(const StringView what, const String& value) -> Result<Enum> {
    if (const Option<Enum> parsed = magic_enum::enum_cast<Enum>(value, magic_enum::case_insensitive))
      return *parsed;

    ERR_FMT(InvalidArgument, "Invalid {} '{}'", what, value);
  }

  template <typename Enum>
  auto LowerName(const Enum value) -> String {
    String name(magic_enum::enum_name(value));

    for (char& chr : name)
      if (chr >= 'A' && chr <= 'Z')
        chr = static_cast<char>(chr - 'A' + 'a');

    return name;
  }
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlSink> {
  using T                     = TomlSink;
  static constexpr auto value = object("kind", &T::kind, "destination", &T::destination, "min_level", &T::min_level, "format", &T::format);
};

template <>
struct glz::meta<TomlOverride> {
  using T                     = TomlOverride;
  static constexpr auto value = object("operation", &T::operation, "policy", &T::policy);
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object(
    "log_level",
    &T::log_level,
    "telemetry_interval_ms",
    &T::telemetry_interval_ms,
    "log_sinks",
    &T::log_sinks,
    "fallback_overrides",
    &T::fallback_overrides
  );
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace conduit::config {
  auto Config::fromToml(const StringView text) -> Result<Config> {
    if (text.find_first_not_of(" \t\r\n") == StringView::npos)
      return Config {};

    TomlConfig tomlCfg;
    String     buffer(text);

    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer))
      ERR_FMT(InvalidArgument, "Failed to parse config: {}", glz::format_error(readError, buffer));

    Config cfg;

    cfg.logLevel = TRY(ParseEnum<LogLevel>("log level", tomlCfg.log_level));

    if (tomlCfg.telemetry_interval_ms == 0)
      ERR(InvalidArgument, "telemetry_interval_ms must be greater than zero");

    cfg.telemetryInterval = Millis(tomlCfg.telemetry_interval_ms);

    for (const TomlSink& sink : tomlCfg.log_sinks) {
      SinkConfig sinkCfg {
        .kind        = TRY(ParseEnum<SinkKind>("sink kind", sink.kind)),
        .destination = sink.destination,
        .minLevel    = TRY(ParseEnum<LogLevel>("sink level", sink.min_level)),
        .format      = TRY(ParseEnum<LogFormat>("log format", sink.format)),
      };

      if (sinkCfg.kind == SinkKind::File && sinkCfg.destination.empty())
        ERR(InvalidArgument, "File sinks need a destination path");

      cfg.logSinks.push_back(std::move(sinkCfg));
    }

    for (const TomlOverride& entry : tomlCfg.fallback_overrides) {
      if (entry.operation.empty())
        ERR(InvalidArgument, "Fallback override is missing its operation name");

      cfg.fallbackPolicyOverrides.insert_or_assign(entry.operation, TRY(ParseEnum<FallbackPolicy>("fallback policy", entry.policy)));
    }

    return cfg;
  }

  auto Config::load(const fs::path& path) -> Result<Config> {
    if (std::error_code errc; !fs::exists(path, errc))
      ERR_FMT(NotFound, "Config file '{}' does not exist", path.string());

    String buffer;

    if (const auto fileError = glz::file_to_buffer(buffer, path.string()); bool(fileError))
      ERR_FMT(PermissionDenied, "Failed to read config file '{}'", path.string());

    Result<Config> cfg = fromToml(buffer);

    if (cfg)
      debug_log("Config loaded from {}", path.string());

    return cfg;
  }

  auto Config::findConfigPath() -> Option<fs::path> {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("CONDUIT_CONFIG"))
      possiblePaths.emplace_back(*result);

#ifdef _WIN32
    if (Result<String> result = GetEnv("LOCALAPPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "conduit" / "config.toml");

    if (Result<String> result = GetEnv("APPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "conduit" / "config.toml");
#else
    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "conduit" / "config.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "conduit" / "config.toml");
#endif

    possiblePaths.emplace_back(fs::path(".") / "conduit.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return None;
  }

  auto Config::loadDefault() -> Result<Config> {
    if (const Option<fs::path> path = findConfigPath())
      return load(*path);

    debug_log("No config file found; using defaults");
    return Config {};
  }

  auto Config::save(const fs::path& path) const -> Result<> {
    TomlConfig tomlCfg {
      .log_level             = LowerName(logLevel),
      .telemetry_interval_ms = static_cast<u64>(telemetryInterval.count()),
      .log_sinks             = {},
      .fallback_overrides    = {},
    };

    for (const SinkConfig& sink : logSinks)
      tomlCfg.log_sinks.push_back({
        .kind        = LowerName(sink.kind),
        .destination = sink.destination,
        .min_level   = LowerName(sink.minLevel),
        .format      = LowerName(sink.format),
      });

    for (const auto& [operation, policy] : fallbackPolicyOverrides)
      tomlCfg.fallback_overrides.push_back({ .operation = operation, .policy = LowerName(policy) });

    if (std::error_code errc; path.has_parent_path() && !fs::exists(path.parent_path(), errc))
      if (fs::create_directories(path.parent_path(), errc); errc)
        ERR_FMT(PermissionDenied, "Failed to create config directory '{}': {}", path.parent_path().string(), errc.message());

    String buffer;

    if (const auto writeError = glz::write_file_toml(tomlCfg, path.string(), buffer))
      ERR_FMT(PermissionDenied, "Failed to write config file '{}': {}", path.string(), glz::format_error(writeError, buffer));

    info_log("Wrote config file {}", path.string());
    return {};
  }
} // namespace conduit::config
