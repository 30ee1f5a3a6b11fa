#pragma once
#include <cstdint>

namespace cmdprof::model {

// Outcome of reading a /proc counter source.
enum class CounterStatus { Ok, IoError, ParseError };

inline const char* to_string(CounterStatus s) {
  switch (s) {
    case CounterStatus::Ok: return "ok";
    case CounterStatus::IoError: return "I/O error";
    case CounterStatus::ParseError: return "parse error";
  }
  return "unknown";
}

// Cumulative jiffies from the aggregate "cpu" record of /proc/stat.
struct CpuCounters {
  uint64_t idle{};
  uint64_t total{};
};

// /proc/meminfo values, already converted to bytes.
struct MemoryCounters {
  uint64_t total{};
  uint64_t free{};
  uint64_t available{};
  uint64_t buffers{};
  uint64_t cached{};
};

struct MemoryUsage {
  uint64_t used_bytes{};
  uint64_t total_bytes{};
  double used_pct{};
};

// One tick worth of readings. Transient: logged and aggregated, then dropped.
struct Sample {
  double cpu_pct{};
  double mem_pct{};
  uint64_t mem_used{};
  uint64_t mem_total{};
  double gpu_pct{};
  bool gpu_available{false};
};

} // namespace cmdprof::model
