#pragma once
#include "model/Aggregate.hpp"
#include "model/Counters.hpp"

#include <string>
#include <vector>

namespace cmdprof::app {

// "CPU:12.34% | Memory:45.67% (1.2 GiB/15 GiB)" plus " | GPU:18.50%" when
// the tick has a GPU reading.
[[nodiscard]] std::string format_sample_line(const cmdprof::model::Sample& s);

// Summary lines for the end of the run. GPU appears only when the probe is
// present; a metric without updates reads "<Metric> (no data)".
[[nodiscard]] std::vector<std::string> format_summary(const cmdprof::model::SessionAggregates& a,
                                                      bool gpu_present);

} // namespace cmdprof::app
