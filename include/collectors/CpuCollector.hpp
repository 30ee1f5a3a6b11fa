#pragma once
#include "model/Counters.hpp"

#include <optional>
#include <string_view>

namespace cmdprof::collectors {

// Parse the first record of /proc/stat. Field 4 (label is field 0) is idle;
// total is the sum of every numeric field after the label.
[[nodiscard]] model::CounterStatus parse_cpu_counters(std::string_view text, model::CpuCounters& out);

[[nodiscard]] model::CounterStatus read_cpu_counters(model::CpuCounters& out);

// Utilization in [0,1] over the interval between two snapshots. Empty when no
// tick elapsed or the counters moved backwards; such a pair is rejected.
[[nodiscard]] std::optional<double> cpu_utilization(const model::CpuCounters& prev,
                                                    const model::CpuCounters& curr);

class CpuCollector {
public:
  CpuCollector() = default;
  explicit CpuCollector(const model::CpuCounters& baseline) : last_(baseline), has_last_(true) {}

  // Reads /proc/stat and computes usage percent against the retained snapshot,
  // which is then replaced. usage_pct is left empty for the first read and
  // for rejected pairs.
  model::CounterStatus sample(std::optional<double>& usage_pct);

  const model::CpuCounters& last() const { return last_; }

private:
  model::CpuCounters last_{};
  bool has_last_{false};
};

} // namespace cmdprof::collectors
