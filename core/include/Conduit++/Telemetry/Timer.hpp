#pragma once

#include <chrono>          // std::chrono::steady_clock
#include <source_location> // std::source_location

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Monitor.hpp"

namespace conduit::telemetry {
  namespace types = ::conduit::utils::types;

  /**
   * @class ScopedTimer
   * @brief Logs how long a scope took, and how much resident memory it added, when it ends.
   *
   * @code
   * {
   *   ScopedTimer timer(monitor, "load index");
   *   LoadIndex();
   * } // DEBUG ... load index took 12ms, elapsed_ms=12, rss_delta=40960
   * @endcode
   *
   * The entry is attributed to the scope that created the timer. The memory
   * delta is omitted where resident memory cannot be sampled.
   */
  class ScopedTimer {
   public:
    ScopedTimer(
      Monitor&                    monitor,
      types::String               label,
      utils::logging::LogLevel    level = utils::logging::LogLevel::Debug,
      const std::source_location& loc   = std::source_location::current()
    );

    ScopedTimer(const ScopedTimer&)                    = delete;
    ScopedTimer(ScopedTimer&&)                         = delete;
    auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;
    auto operator=(ScopedTimer&&) -> ScopedTimer&      = delete;
    ~ScopedTimer();

    [[nodiscard]] auto elapsed() const -> types::Millis;

   private:
    Monitor&                              m_monitor;
    types::String                         m_label;
    utils::logging::LogLevel              m_level;
    std::source_location                  m_location;
    std::chrono::steady_clock::time_point m_start;
    types::Option<types::f64>             m_startRss;
  };
} // namespace conduit::telemetry
