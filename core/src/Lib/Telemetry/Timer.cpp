#include <Conduit++/Telemetry/Timer.hpp>
#include <Conduit++/Utils/Logging.hpp>

using namespace conduit::utils::types;

namespace logging = conduit::utils::logging;

namespace conduit::telemetry {
  ScopedTimer::ScopedTimer(Monitor& monitor, String label, const logging::LogLevel level, const std::source_location& loc)
    : m_monitor(monitor), m_label(std::move(label)), m_level(level), m_location(loc) {
    if (level >= logging::GetRuntimeLogLevel())
      if (Result<TelemetrySample> rss = m_monitor.sample(ResourceKind::ResidentMemory))
        m_startRss = rss->value;

    m_start = std::chrono::steady_clock::now();
  }

  auto ScopedTimer::elapsed() const -> Millis {
    return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - m_start);
  }

  ScopedTimer::~ScopedTimer() {
    if (m_level < logging::GetRuntimeLogLevel())
      return;

    const Millis taken = elapsed();

    Vec<logging::Field> fields = logging::Fields(field(elapsed_ms, taken.count()));

    if (m_startRss)
      if (Result<TelemetrySample> rss = m_monitor.sample(ResourceKind::ResidentMemory))
        fields.push_back(field(rss_delta, static_cast<i64>(rss->value - *m_startRss)));

    logging::LogImpl(m_level, m_location, logging::ExtractTarget(m_location.function_name()), std::move(fields), "{} took {}ms", m_label, taken.count());
  }
} // namespace conduit::telemetry
