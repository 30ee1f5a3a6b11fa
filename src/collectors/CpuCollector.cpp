#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>

namespace cmdprof::collectors {

static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r'; }

model::CounterStatus parse_cpu_counters(std::string_view text, model::CpuCounters& out) {
  std::string_view line = text.substr(0, text.find('\n'));
  size_t pos = 0;
  int index = 0;
  uint64_t idle = 0, total = 0;
  while (pos < line.size()) {
    while (pos < line.size() && is_space(line[pos])) ++pos;
    if (pos >= line.size()) break;
    size_t end = pos;
    while (end < line.size() && !is_space(line[end])) ++end;
    std::string_view field = line.substr(pos, end - pos);
    if (index == 0) {
      // aggregate record label
      if (!field.starts_with("cpu")) return model::CounterStatus::ParseError;
    } else {
      uint64_t v = 0;
      auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), v);
      if (ec != std::errc() || ptr != field.data() + field.size()) return model::CounterStatus::ParseError;
      if (index == 4) idle = v;
      total += v;
    }
    ++index;
    pos = end;
  }
  if (index < 5) return model::CounterStatus::ParseError;
  out.idle = idle;
  out.total = total;
  return model::CounterStatus::Ok;
}

model::CounterStatus read_cpu_counters(model::CpuCounters& out) {
  auto txt = cmdprof::util::read_file_string("/proc/stat");
  if (!txt) return model::CounterStatus::IoError;
  return parse_cpu_counters(*txt, out);
}

std::optional<double> cpu_utilization(const model::CpuCounters& prev, const model::CpuCounters& curr) {
  if (curr.total <= prev.total || curr.idle < prev.idle) return std::nullopt;
  auto d_total = curr.total - prev.total;
  auto d_idle = curr.idle - prev.idle;
  if (d_idle > d_total) return std::nullopt;
  return 1.0 - static_cast<double>(d_idle) / static_cast<double>(d_total);
}

model::CounterStatus CpuCollector::sample(std::optional<double>& usage_pct) {
  usage_pct.reset();
  model::CpuCounters cur{};
  auto st = read_cpu_counters(cur);
  if (st != model::CounterStatus::Ok) return st;
  if (has_last_) {
    if (auto u = cpu_utilization(last_, cur)) usage_pct = *u * 100.0;
  }
  last_ = cur; has_last_ = true;
  return st;
}

} // namespace cmdprof::collectors
