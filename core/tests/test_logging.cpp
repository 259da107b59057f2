#include <boost/ut.hpp>

#include <chrono>
#include <fstream>

#include <Conduit++/Core/Context.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Telemetry/Logger.hpp>
#include <Conduit++/Utils/Logging.hpp>

using namespace boost::ut;
using namespace conduit::telemetry;
using namespace conduit::utils::types;

using conduit::config::Config;
using conduit::config::LogFormat;
using conduit::config::SinkConfig;
using conduit::config::SinkKind;
using conduit::core::Context;
using conduit::core::capability::CapabilityDescriptor;
using conduit::core::capability::CapabilityRegistry;
using conduit::core::platform::Detect;
using conduit::core::platform::GetKnownDirectory;
using conduit::core::platform::KnownDirectory;
using conduit::utils::error::ConduitError;
using conduit::utils::error::ErrorKind;
using conduit::utils::logging::Field;
using conduit::utils::logging::LogEntry;
using conduit::utils::logging::LogLevel;

namespace logging = conduit::utils::logging;
namespace ops     = conduit::core::ops;

namespace {
  class CollectingSink final : public LogSink {
   public:
    CollectingSink(const LogLevel minLevel, Vec<LogEntry>& out) : LogSink(minLevel), m_out(out) {}

    auto write(const LogEntry& entry) -> Result<> override {
      m_out.push_back(entry);
      return {};
    }

   private:
    Vec<LogEntry>& m_out;
  };

  class FailingSink final : public LogSink {
   public:
    FailingSink() : LogSink(LogLevel::Trace) {}

    auto write(const LogEntry&) -> Result<> override {
      return Err(ConduitError(ErrorKind::PlatformError, "disk on fire"));
    }
  };

  auto Entry(const LogLevel level, String message, Vec<Field> fields = {}) -> LogEntry {
    using namespace std::chrono;

    return LogEntry {
      .level     = level,
      .message   = std::move(message),
      .fields    = std::move(fields),
      .timestamp = sys_days(year(2024) / 1 / 2) + hours(3) + minutes(4) + seconds(5) + milliseconds(678),
      .target    = "conduit::files",
      .location  = std::source_location::current(),
    };
  }

  template <typename Sink>
  concept FileSinkBuildableOutsideOpen = requires(std::ofstream stream) {
    Sink(typename Sink::OpenToken {}, std::move(stream), String(), LogLevel::Info, LogFormat::Text);
  };

  template <typename Sink>
  concept NativeSinkBuildableOutsideOpen = requires { Sink(typename Sink::OpenToken {}, String(), LogLevel::Info); };

  static_assert(!FileSinkBuildableOutsideOpen<FileSink>, "FileSink must only be created through open()");
  static_assert(!NativeSinkBuildableOutsideOpen<NativeSink>, "NativeSink must only be created through open()");
} // namespace

auto main() -> int {
  "FormatStructured renders one JSON object"_test = [] -> void {
    const Result<String> json = FormatStructured(Entry(LogLevel::Warn, "disk almost full", { { "free", "12" }, { "device", "sda1" } }));

    expect(json == String(
                     R"({"timestamp":"2024-01-02T03:04:05.678Z","level":"warn","target":"conduit::files",)"
                     R"("message":"disk almost full","fields":{"device":"sda1","free":"12"}})"
                   ));
  };

  "FormatStructured escapes strings"_test = [] -> void {
    const Result<String> json = FormatStructured(Entry(LogLevel::Info, R"(say "hi")"));

    expect(json.has_value());
    expect(json && json->contains(R"("message":"say \"hi\"")"));
    expect(json && json->contains(R"("fields":{})"));
  };

  "Sinks only see entries at or above their level"_test = [] -> void {
    Vec<LogEntry> seen;
    Logger        logger;

    logger.addSink(std::make_unique<CollectingSink>(LogLevel::Warn, seen));

    logger.route(Entry(LogLevel::Info, "quiet"));
    logger.route(Entry(LogLevel::Warn, "loud"));
    logger.route(Entry(LogLevel::Error, "louder"));

    expect(seen.size() == usize(2));
    expect(seen.size() == usize(2) && seen[0].message == String("loud") && seen[1].message == String("louder"));
  };

  "A failing sink does not stop the others"_test = [] -> void {
    Vec<LogEntry> seen;
    Logger        logger;

    logger.addSink(std::make_unique<FailingSink>());
    logger.addSink(std::make_unique<CollectingSink>(LogLevel::Trace, seen));

    logger.log(LogLevel::Info, "still delivered");

    expect(logger.sinkCount() == usize(2));
    expect(seen.size() == usize(1));
    expect(logger.flush().has_value());
  };

  "Logger::log bypasses the runtime threshold"_test = [] -> void {
    Vec<LogEntry> seen;
    Logger        logger;

    logger.addSink(std::make_unique<CollectingSink>(LogLevel::Trace, seen));

    const LogLevel previous = logging::GetRuntimeLogLevel();
    logging::SetRuntimeLogLevel(LogLevel::Error);

    logger.log(LogLevel::Debug, "direct", { Field::create("attempt", 3) });

    logging::SetRuntimeLogLevel(previous);

    expect(seen.size() == usize(1));
    expect(!seen.empty() && seen[0].fields == Vec<Field> { { "attempt", "3" } });
  };

  "Installed logger receives internal diagnostics"_test = [] -> void {
    Vec<LogEntry> seen;
    Logger        logger;

    logger.addSink(std::make_unique<CollectingSink>(LogLevel::Trace, seen));

    {
      const Logger::InstallGuard guard = logger.install();

      warn_log_fields(logging::Fields(field(attempt, 2), field(path, "/tmp/x")), "retrying {}", "open");
    }

    expect(seen.size() == usize(1));

    if (seen.size() == 1) {
      expect(seen[0].level == LogLevel::Warn);
      expect(seen[0].message == String("retrying open"));
      expect(seen[0].fields == Vec<Field> { { "attempt", "2" }, { "path", "/tmp/x" } });
      expect(!seen[0].target.empty());
    }

    expect(logging::ActiveLogRouter() == nullptr);

    warn_log("not routed");

    expect(seen.size() == usize(1));
  };

  "Routers can be released in any order"_test = [] -> void {
    Vec<LogEntry> first;
    Vec<LogEntry> second;

    auto older = std::make_unique<Logger>();
    auto newer = std::make_unique<Logger>();

    older->addSink(std::make_unique<CollectingSink>(LogLevel::Trace, first));
    newer->addSink(std::make_unique<CollectingSink>(LogLevel::Trace, second));

    Option<Logger::InstallGuard> olderGuard(older->install());
    Option<Logger::InstallGuard> newerGuard(newer->install());

    expect(logging::ActiveLogRouter() == newer.get());

    olderGuard.reset();
    older.reset();

    expect(logging::ActiveLogRouter() == newer.get());

    warn_log("still routed");

    expect(second.size() == usize(1));

    newerGuard.reset();
    newer.reset();

    expect(logging::ActiveLogRouter() == nullptr);

    warn_log("back on the console");

    expect(first.empty());
    expect(second.size() == usize(1));
  };

  "Text formatting"_test = [] -> void {
    const String line = logging::FormatText(Entry(LogLevel::Error, "boom", { { "code", "5" } }), false);

    expect(line.contains("ERROR")) << line;
    expect(line.contains("conduit::files: boom, code=5")) << line;
    expect(line.ends_with('\n'));
  };

  "Logger::create builds the configured sinks"_test = [] -> void {
    const String dir  = GetKnownDirectory(Detect(), KnownDirectory::Temp).value_or("/tmp");
    const String path = std::format("{}/conduit-log-{}.jsonl", dir, std::chrono::steady_clock::now().time_since_epoch().count());

    Config config;
    config.logSinks = {
      SinkConfig { .kind = SinkKind::Console, .destination = {}, .minLevel = LogLevel::Error, .format = LogFormat::Text },
      SinkConfig { .kind = SinkKind::File, .destination = path, .minLevel = LogLevel::Info, .format = LogFormat::Structured },
    };

    const Result<UniquePointer<Context>> ctx = Context::create(config);

    expect(ctx.has_value());
    if (!ctx)
      return;

    Result<UniquePointer<Logger>> logger = Logger::create(**ctx);

    expect(logger.has_value());
    if (!logger)
      return;

    expect((*logger)->sinkCount() == usize(2));

    (*logger)->log(LogLevel::Debug, "filtered out");
    (*logger)->log(LogLevel::Info, "written", { Field::create("bytes", 42) });

    expect((*logger)->flush().has_value());

    conduit::files::FileSystem fs(**ctx);

    const Result<String> contents = fs.readText(path);

    expect(contents.has_value());
    expect(contents && !contents->contains("filtered out"));
    expect(contents && contents->contains(R"("message":"written","fields":{"bytes":"42"})"));
    expect(contents && contents->ends_with('\n'));

    expect(fs.remove(path).has_value());
  };

  "File sinks need a path"_test = [] -> void {
    const Result<UniquePointer<Context>> ctx = Context::create();

    expect(ctx.has_value());
    if (!ctx)
      return;

    const Result<UniquePointer<FileSink>> sink = FileSink::open(**ctx, "", LogLevel::Info, LogFormat::Text);

    expect(!sink && sink.error().kind == ErrorKind::InvalidArgument);

    const Result<UniquePointer<FileSink>> missingDir = FileSink::open(**ctx, "/nonexistent/conduit/dir/app.log", LogLevel::Info, LogFormat::Text);

    expect(!missingDir.has_value());
  };

  "Native sink drops entries when no native log exists"_test = [] -> void {
    Vec<CapabilityDescriptor> table = CapabilityRegistry::defaultTable();

    for (CapabilityDescriptor& descriptor : table)
      if (descriptor.operation == ops::LogNative)
        descriptor.entries.clear();

    const Context ctx(Detect(), CapabilityRegistry(std::move(table)));

    const Result<UniquePointer<NativeSink>> sink = NativeSink::open(ctx, "conduit-test", LogLevel::Info);

    expect(sink.has_value());
    if (!sink)
      return;

    expect(!(*sink)->isDelivering());
    expect((*sink)->write(Entry(LogLevel::Error, "dropped")).has_value());
  };

  return 0;
}
