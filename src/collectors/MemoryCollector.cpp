#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>

namespace cmdprof::collectors {

static inline bool parse_kib(std::string_view sv, uint64_t& out) {
  // strip leading spaces and a trailing unit (e.g., kB)
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  size_t end = 0;
  while (end < sv.size() && sv[end] >= '0' && sv[end] <= '9') ++end;
  if (end == 0) return false;
  auto rest = sv.substr(end);
  while (!rest.empty() && (rest.front() == ' ' || rest.front() == '\t')) rest.remove_prefix(1);
  while (!rest.empty() && (rest.back() == ' ' || rest.back() == '\t' || rest.back() == '\r')) rest.remove_suffix(1);
  if (!rest.empty() && rest != "kB") return false;
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + end, v);
  if (ec != std::errc()) return false;
  out = v * 1024;
  return true;
}

model::CounterStatus parse_meminfo(std::string_view txt, model::MemoryCounters& out) {
  model::MemoryCounters m{};
  bool have_total = false, have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string_view::npos) end = txt.size();
    std::string_view line = txt.substr(start, end - start);
    start = end + 1;
    auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    auto key = line.substr(0, colon);
    auto val = line.substr(colon + 1);
    uint64_t* slot = nullptr;
    if (key == "MemTotal") { slot = &m.total; have_total = true; }
    else if (key == "MemFree") slot = &m.free;
    else if (key == "MemAvailable") { slot = &m.available; have_avail = true; }
    else if (key == "Buffers") slot = &m.buffers;
    else if (key == "Cached") slot = &m.cached;
    if (!slot) continue;
    if (!parse_kib(val, *slot)) return model::CounterStatus::ParseError;
  }
  if (!have_total || m.total == 0) return model::CounterStatus::ParseError;
  // Kernels before 3.14 lack MemAvailable
  if (!have_avail) m.available = m.free + m.buffers + m.cached;
  out = m;
  return model::CounterStatus::Ok;
}

model::MemoryUsage memory_usage(const model::MemoryCounters& m) {
  model::MemoryUsage u{};
  u.total_bytes = m.total;
  u.used_bytes = (m.total > m.available) ? (m.total - m.available) : 0;
  u.used_pct = (m.total > 0) ? (100.0 * static_cast<double>(u.used_bytes) / static_cast<double>(m.total)) : 0.0;
  return u;
}

model::CounterStatus MemoryCollector::sample(model::MemoryCounters& out) const {
  auto txt = cmdprof::util::read_file_string("/proc/meminfo");
  if (!txt) return model::CounterStatus::IoError;
  return parse_meminfo(*txt, out);
}

} // namespace cmdprof::collectors
