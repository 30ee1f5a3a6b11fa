#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include "app/LogSink.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/GpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "model/Aggregate.hpp"
#include "model/Counters.hpp"

namespace cmdprof::app {

struct SamplerSettings {
  std::chrono::milliseconds interval{250};
  std::chrono::milliseconds baseline{1000};

  // Delay before the first tick, so the first delta spans at least one full
  // interval.
  std::chrono::milliseconds warmup() const { return baseline + interval + std::chrono::milliseconds(1); }
};

// Periodic background sampler: Idle -> Baseline -> Running -> Stopped.
//
// The sampler thread is the only writer of the aggregates. Cancellation is
// observed only while waiting for the next tick: a tick that has started when
// stop() is called runs to completion and counts, and no tick starts after the
// request has been observed.
class Sampler {
public:
  enum class State { Idle, Baseline, Running, Stopped };

  Sampler(LogSink& log, cmdprof::collectors::GpuCollector& gpu, SamplerSettings settings);
  ~Sampler();
  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  // baseline is the reference snapshot for the first CPU delta. Has no
  // effect unless the sampler is Idle.
  void start(const cmdprof::model::CpuCounters& baseline);
  // One-shot. Returns after the sampler thread has exited.
  void stop();

  State state() const { return state_.load(); }
  // Stable once stop() has returned.
  const cmdprof::model::SessionAggregates& aggregates() const { return aggs_; }

#ifdef CMDPROF_TESTING
  // Test-only helpers: drive ticks synchronously without the thread.
  void test_prime(const cmdprof::model::CpuCounters& baseline) { cpu_ = cmdprof::collectors::CpuCollector(baseline); }
  void test_tick() { tick(); }
#endif

private:
  void run(std::stop_token st);
  void tick();

  LogSink& log_;
  cmdprof::collectors::GpuCollector& gpu_;
  SamplerSettings settings_;
  cmdprof::collectors::CpuCollector cpu_{};
  cmdprof::collectors::MemoryCollector mem_{};
  cmdprof::model::SessionAggregates aggs_{};
  // last good readings, reused when a tick's read fails
  double last_cpu_pct_{0.0};
  cmdprof::model::MemoryUsage last_mem_{};
  std::atomic<State> state_{State::Idle};
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::jthread thread_{};
};

} // namespace cmdprof::app
