#include "app/Report.hpp"
#include "util/Formatting.hpp"

#include <cstdio>

namespace cmdprof::app {

using cmdprof::util::format_ibytes;

std::string format_sample_line(const cmdprof::model::Sample& s) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "CPU:%.2f%% | Memory:%.2f%% (%s/%s)",
                s.cpu_pct, s.mem_pct,
                format_ibytes(s.mem_used).c_str(), format_ibytes(s.mem_total).c_str());
  std::string line = buf;
  if (s.gpu_available) {
    std::snprintf(buf, sizeof(buf), " | GPU:%.2f%%", s.gpu_pct);
    line += buf;
  }
  return line;
}

static std::string percent_line(const char* label, const cmdprof::model::RunningAggregate<double>& agg) {
  auto f = agg.finalize();
  if (!f) return std::string(label) + " (no data)";
  char buf[160];
  std::snprintf(buf, sizeof(buf), "%s (min: %.2f%%, max: %.2f%%, range: %.2f%%, avg: %.2f%%)",
                label, f->min, f->max, f->range, f->avg);
  return buf;
}

std::vector<std::string> format_summary(const cmdprof::model::SessionAggregates& a, bool gpu_present) {
  std::vector<std::string> out;
  out.push_back(percent_line("CPU", a.cpu_pct));

  if (auto m = a.mem_used.finalize()) {
    out.push_back("Memory (min: " + format_ibytes(m->min) +
                  ", max: " + format_ibytes(m->max) +
                  ", range: " + format_ibytes(m->range) +
                  ", avg: " + format_ibytes(static_cast<uint64_t>(m->avg)) + ")");
  } else {
    out.emplace_back("Memory (no data)");
  }

  if (gpu_present) out.push_back(percent_line("GPU", a.gpu_pct));
  out.push_back("Samples: " + std::to_string(a.ticks));
  return out;
}

} // namespace cmdprof::app
