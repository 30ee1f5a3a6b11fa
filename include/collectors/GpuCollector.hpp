#pragma once
#include "app/Config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cmdprof::collectors {

struct GpuReading {
  double percent{};
  bool available{false};
};

// One nvidia-smi csv field ("37", "37 %", "[N/A]"). Empty if not a number.
[[nodiscard]] std::optional<double> parse_smi_utilization(std::string_view field);

// Mean across devices; an unparsed device counts as 0. No devices means the
// reading is unavailable.
[[nodiscard]] GpuReading aggregate_gpu_utilization(const std::vector<std::optional<double>>& per_device);

// Resolve the nvidia-smi executable. "auto" searches PATH, then standard
// install locations. Returns an empty string when nothing executable is found.
[[nodiscard]] std::string find_nvidia_smi(const std::string& configured);

// Optional GPU utilization source. Capability is decided once, at
// construction; an absent probe never reports a reading.
class GpuCollector {
public:
  explicit GpuCollector(const cmdprof::app::GpuConfig& cfg);

  bool present() const { return kind_ != Kind::Absent; }
  const char* backend_name() const;
  const std::string& detail() const { return detail_; }

  // Query every device now. available=false when absent, or when this query
  // produced no devices.
  GpuReading probe();

private:
  enum class Kind { Absent, Smi, Nvml };
  bool query_smi(std::vector<std::optional<double>>& per_device) const;

  Kind kind_{Kind::Absent};
  std::string detail_;
};

} // namespace cmdprof::collectors
