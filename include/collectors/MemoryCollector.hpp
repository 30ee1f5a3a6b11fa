#pragma once
#include "model/Counters.hpp"

#include <string_view>

namespace cmdprof::collectors {

// Parse /proc/meminfo text. Values are kibibytes and are returned in bytes.
// Unrecognized labels are skipped; a recognized label with a malformed value,
// or a missing MemTotal, is a parse error.
[[nodiscard]] model::CounterStatus parse_meminfo(std::string_view text, model::MemoryCounters& out);

// used = total - available; percent of total.
[[nodiscard]] model::MemoryUsage memory_usage(const model::MemoryCounters& m);

class MemoryCollector {
public:
  model::CounterStatus sample(model::MemoryCounters& out) const;
};

} // namespace cmdprof::collectors
