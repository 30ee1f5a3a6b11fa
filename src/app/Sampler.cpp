#include "app/Sampler.hpp"
#include "app/Report.hpp"

using namespace std::chrono;

namespace cmdprof::app {

using cmdprof::model::CounterStatus;

Sampler::Sampler(LogSink& log, cmdprof::collectors::GpuCollector& gpu, SamplerSettings settings)
    : log_(log), gpu_(gpu), settings_(settings) {}

Sampler::~Sampler() { stop(); }

void Sampler::start(const cmdprof::model::CpuCounters& baseline) {
  State expected = State::Idle;
  if (!state_.compare_exchange_strong(expected, State::Baseline)) return;
  cpu_ = cmdprof::collectors::CpuCollector(baseline);
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Sampler::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  state_.store(State::Stopped);
}

void Sampler::run(std::stop_token st) {
  auto next = steady_clock::now() + settings_.warmup();
  std::unique_lock<std::mutex> lk(mu_);
  while (true) {
    // Nothing notifies cv_ except the stop request; the predicate never
    // ends the wait early.
    cv_.wait_until(lk, st, next, []{ return false; });
    if (st.stop_requested()) break;
    state_.store(State::Running);
    lk.unlock();
    tick();
    lk.lock();
    next += settings_.interval;
    auto now = steady_clock::now();
    // Skip ticks we overslept instead of bursting to catch up
    if (next <= now) next = now + settings_.interval;
  }
}

void Sampler::tick() {
  cmdprof::model::Sample s{};

  std::optional<double> cpu;
  auto cst = cpu_.sample(cpu);
  if (cst != CounterStatus::Ok) {
    log_.warnf("CPU counters unreadable (%s), reusing %.2f%%", cmdprof::model::to_string(cst), last_cpu_pct_);
  } else if (!cpu) {
    log_.warnf("No CPU time elapsed since the previous sample, reusing %.2f%%", last_cpu_pct_);
  } else {
    last_cpu_pct_ = *cpu;
  }
  s.cpu_pct = last_cpu_pct_;

  cmdprof::model::MemoryCounters mc{};
  auto mst = mem_.sample(mc);
  if (mst == CounterStatus::Ok) {
    last_mem_ = cmdprof::collectors::memory_usage(mc);
  } else {
    log_.warnf("Memory counters unreadable (%s), reusing last reading", cmdprof::model::to_string(mst));
  }
  s.mem_used = last_mem_.used_bytes;
  s.mem_total = last_mem_.total_bytes;
  s.mem_pct = last_mem_.used_pct;

  if (gpu_.present()) {
    auto g = gpu_.probe();
    if (g.available) {
      s.gpu_pct = g.percent;
      s.gpu_available = true;
    } else {
      log_.warnf("GPU probe (%s) returned no devices", gpu_.backend_name());
    }
  }

  aggs_.cpu_pct.update(s.cpu_pct);
  aggs_.mem_used.update(s.mem_used);
  if (s.gpu_available) aggs_.gpu_pct.update(s.gpu_pct);
  ++aggs_.ticks;

  log_.logf("%s", format_sample_line(s).c_str());
}

} // namespace cmdprof::app
