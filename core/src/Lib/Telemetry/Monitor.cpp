#include <algorithm> // std::max
#include <chrono>    // std::chrono::{steady_clock, duration}
#include <utility>   // std::exchange

#include <Conduit++/Core/Dispatch.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Telemetry/Monitor.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

#include "Telemetry/TelemetryBackend.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::Dispatch;
using conduit::core::capability::BackendId;

namespace ops = conduit::core::ops;

namespace {
  using conduit::telemetry::GetTelemetryBackend;
  using conduit::telemetry::IoCounters;
  using conduit::telemetry::MemoryUsage;
  using conduit::telemetry::TelemetryBackend;

  auto CpuSeconds(const conduit::core::Context& ctx) -> Result<f64> {
    return Dispatch<f64>(ctx, ops::MonitorCpuTime, { .native = [](const BackendId id) -> Result<f64> {
      TelemetryBackend* backend = TRY(GetTelemetryBackend(id));
      return backend->cpuTime();
    } });
  }

  auto Memory(const conduit::core::Context& ctx) -> Result<MemoryUsage> {
    return Dispatch<MemoryUsage>(ctx, ops::MonitorMemory, { .native = [](const BackendId id) -> Result<MemoryUsage> {
      TelemetryBackend* backend = TRY(GetTelemetryBackend(id));
      return backend->memory();
    } });
  }

  auto SystemMemory(const conduit::core::Context& ctx) -> Result<u64> {
    return Dispatch<u64>(ctx, ops::MonitorSystemMemory, { .native = [](const BackendId id) -> Result<u64> {
      TelemetryBackend* backend = TRY(GetTelemetryBackend(id));
      return backend->systemMemoryUsed();
    } });
  }

  auto Io(const conduit::core::Context& ctx) -> Result<IoCounters> {
    return Dispatch<IoCounters>(ctx, ops::MonitorIo, { .native = [](const BackendId id) -> Result<IoCounters> {
      TelemetryBackend* backend = TRY(GetTelemetryBackend(id));
      return backend->io();
    } });
  }
} // namespace

namespace conduit::telemetry {
  // ─────────────────────────────────────────────────────────────────────────────
  // Monitor
  // ─────────────────────────────────────────────────────────────────────────────

  Monitor::Monitor(const core::Context& ctx) : m_ctx(ctx), m_lastWall(std::chrono::steady_clock::now()) {
    if (Result<f64> baseline = CpuSeconds(ctx))
      m_lastCpu = *baseline;
    else
      debug_at(baseline.error());
  }

  auto Monitor::cpuUsage() -> Result<f64> {
    const f64  cpu  = TRY(CpuSeconds(m_ctx));
    const auto wall = std::chrono::steady_clock::now();

    const LockGuard lock(m_cpuMutex);

    const Option<f64> previousCpu  = std::exchange(m_lastCpu, cpu);
    const auto        previousWall = std::exchange(m_lastWall, wall);

    if (!previousCpu)
      return 0.0;

    const f64 elapsed = std::chrono::duration<f64>(wall - previousWall).count();

    if (elapsed <= 0.0)
      return 0.0;

    return std::max(0.0, (cpu - *previousCpu) / elapsed * 100.0);
  }

  auto Monitor::sample(const ResourceKind kind) -> Result<TelemetrySample> {
    using enum ResourceKind;

    f64 value = 0.0;

    switch (kind) {
      case ProcessCpuTime:   value = TRY(CpuSeconds(m_ctx)); break;
      case CpuUsage:         value = TRY(cpuUsage()); break;
      case ResidentMemory:   value = static_cast<f64>(TRY(Memory(m_ctx)).resident); break;
      case VirtualMemory:    value = static_cast<f64>(TRY(Memory(m_ctx)).virtualSize); break;
      case SystemMemoryUsed: value = static_cast<f64>(TRY(SystemMemory(m_ctx))); break;
      case IoReadBytes:      value = static_cast<f64>(TRY(Io(m_ctx)).readBytes); break;
      case IoWriteBytes:     value = static_cast<f64>(TRY(Io(m_ctx)).writeBytes); break;
    }

    return TelemetrySample {
      .timestamp = std::chrono::system_clock::now(),
      .kind      = kind,
      .value     = value,
    };
  }

  auto Monitor::sampleAll(const Span<const ResourceKind> kinds) -> Result<Vec<TelemetrySample>> {
    Vec<TelemetrySample> samples;
    samples.reserve(kinds.size());

    for (const ResourceKind kind : kinds)
      samples.push_back(TRY(sample(kind)));

    return samples;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // PeriodicSampler
  // ─────────────────────────────────────────────────────────────────────────────

  PeriodicSampler::PeriodicSampler(Monitor& monitor) : m_monitor(monitor) {}

  PeriodicSampler::~PeriodicSampler() {
    stop();
  }

  auto PeriodicSampler::start(Vec<ResourceKind> kinds, const Millis interval, Callback callback) -> Result<> {
    if (kinds.empty())
      ERR(InvalidArgument, "No resource kinds to sample");

    if (interval.count() <= 0)
      ERR_FMT(InvalidArgument, "Sampling interval must be positive, got {}ms", interval.count());

    if (!callback)
      ERR(InvalidArgument, "Sampling callback is empty");

    const LockGuard lock(m_mutex);

    if (m_worker.joinable())
      ERR(ResourceBusy, "Sampler is already running");

    debug_log_fields(Fields(field(kinds, kinds.size()), field(interval_ms, interval.count())), "Starting periodic sampler");

    m_worker = std::jthread([this, kinds = std::move(kinds), interval, callback = std::move(callback)](const std::stop_token& stopToken) {
      while (!stopToken.stop_requested()) {
        for (const ResourceKind kind : kinds) {
          if (stopToken.stop_requested())
            return;

          callback(m_monitor.sample(kind));
        }

        std::unique_lock lock(m_mutex);
        m_wake.wait_for(lock, stopToken, interval, [] { return false; });
      }
    });

    return {};
  }

  auto PeriodicSampler::start(Vec<ResourceKind> kinds, Callback callback) -> Result<> {
    return start(std::move(kinds), m_monitor.context().config().telemetryInterval, std::move(callback));
  }

  auto PeriodicSampler::stop() -> void {
    std::jthread worker;

    {
      const LockGuard lock(m_mutex);
      worker = std::move(m_worker);
    }

    if (!worker.joinable())
      return;

    worker.request_stop();
    worker.join();

    debug_log("Periodic sampler stopped");
  }

  auto PeriodicSampler::isRunning() const -> bool {
    const LockGuard lock(m_mutex);
    return m_worker.joinable();
  }
} // namespace conduit::telemetry
