#include "util/Formatting.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace cmdprof::util {

std::string format_ibytes(uint64_t bytes) {
  static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
  if (bytes < 1024) return std::to_string(bytes) + " B";
  double v = static_cast<double>(bytes);
  int u = 0;
  while (v >= 1024.0 && u < 6) { v /= 1024.0; ++u; }
  // round to one decimal first so 9.96 KiB prints as "10 KiB"
  v = std::floor(v * 10.0 + 0.5) / 10.0;
  char buf[32];
  if (v < 10.0) std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
  else std::snprintf(buf, sizeof(buf), "%.0f %s", v, units[u]);
  return buf;
}

std::string format_stamp(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (ms < 0) ms += 1000;
  char date[32];
  std::strftime(date, sizeof(date), "%b %e %H:%M:%S", &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s.%03d", date, static_cast<int>(ms));
  return buf;
}

std::string format_elapsed(std::chrono::steady_clock::duration d) {
  double secs = std::chrono::duration<double>(d).count();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3fs", secs);
  return buf;
}

} // namespace cmdprof::util
