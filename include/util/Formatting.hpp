#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cmdprof::util {

// IEC byte size: "512 B", "1.5 KiB", "79 MiB". One decimal below 10.
std::string format_ibytes(uint64_t bytes);

// Local wall-clock stamp with milliseconds: "Jan  2 15:04:05.000".
std::string format_stamp(std::chrono::system_clock::time_point tp);
inline std::string format_stamp_now() { return format_stamp(std::chrono::system_clock::now()); }

// Elapsed time as seconds with millisecond precision: "1.234s".
std::string format_elapsed(std::chrono::steady_clock::duration d);

} // namespace cmdprof::util
