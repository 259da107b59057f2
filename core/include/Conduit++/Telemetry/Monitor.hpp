#pragma once

#include <condition_variable> // std::condition_variable_any
#include <thread>             // std::jthread

#include "../Core/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace conduit::telemetry {
  namespace types = ::conduit::utils::types;

  /**
   * @enum ResourceKind
   * @brief What a TelemetrySample measures.
   */
  enum class ResourceKind : types::u8 {
    ProcessCpuTime,   ///< User + system CPU time of this process, in seconds.
    CpuUsage,         ///< Percent of one core used since the previous CpuUsage sample from the same Monitor.
    ResidentMemory,   ///< Resident set size of this process, in bytes.
    VirtualMemory,    ///< Virtual size of this process, in bytes.
    SystemMemoryUsed, ///< Physical memory in use system-wide, in bytes.
    IoReadBytes,      ///< Bytes this process has read from storage.
    IoWriteBytes,     ///< Bytes this process has written to storage.
  };

  /**
   * @struct TelemetrySample
   * @brief One immutable measurement.
   */
  struct TelemetrySample {
    types::Timestamp timestamp;
    ResourceKind     kind  = ResourceKind::ProcessCpuTime;
    types::f64       value = 0.0;
  };

  /**
   * @class Monitor
   * @brief Pull-based resource sampling. Safe to share between threads.
   */
  class Monitor {
   public:
    explicit Monitor(const core::Context& ctx);

    /**
     * @brief Takes one sample.
     * @return Unsupported where the platform has no source for `kind`.
     *
     * The first CpuUsage sample measures from the Monitor's construction.
     */
    auto sample(ResourceKind kind) -> types::Result<TelemetrySample>;

    /**
     * @brief Samples each kind in order; fails on the first unsupported kind.
     */
    auto sampleAll(types::Span<const ResourceKind> kinds) -> types::Result<types::Vec<TelemetrySample>>;

    [[nodiscard]] auto context() const -> const core::Context& {
      return m_ctx;
    }

   private:
    auto cpuUsage() -> types::Result<types::f64>;

    const core::Context& m_ctx;

    types::Mutex                          m_cpuMutex;
    std::chrono::steady_clock::time_point m_lastWall;
    types::Option<types::f64>             m_lastCpu;
  };

  /**
   * @class PeriodicSampler
   * @brief Samples on a single caller-owned worker thread between start() and stop().
   *
   * The callback runs on the worker. stop() interrupts the wait immediately and
   * joins; the destructor calls stop().
   */
  class PeriodicSampler {
   public:
    using Callback = types::Fn<void(const types::Result<TelemetrySample>&)>;

    explicit PeriodicSampler(Monitor& monitor);

    PeriodicSampler(const PeriodicSampler&)                    = delete;
    PeriodicSampler(PeriodicSampler&&)                         = delete;
    auto operator=(const PeriodicSampler&) -> PeriodicSampler& = delete;
    auto operator=(PeriodicSampler&&) -> PeriodicSampler&      = delete;
    ~PeriodicSampler();

    /**
     * @brief Starts sampling `kinds` every `interval`, first round immediately.
     * @return ResourceBusy if already running; InvalidArgument for an empty kind list or a non-positive interval.
     */
    auto start(types::Vec<ResourceKind> kinds, types::Millis interval, Callback callback) -> types::Result<>;

    /**
     * @brief Starts with the context's configured telemetry interval.
     */
    auto start(types::Vec<ResourceKind> kinds, Callback callback) -> types::Result<>;

    auto stop() -> void;

    [[nodiscard]] auto isRunning() const -> bool;

   private:
    Monitor&                    m_monitor;
    mutable types::Mutex        m_mutex;
    std::condition_variable_any m_wake;
    std::jthread                m_worker;
  };
} // namespace conduit::telemetry
