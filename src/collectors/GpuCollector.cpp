#include "collectors/GpuCollector.hpp"
#include "util/NvmlDyn.hpp"

#include <unistd.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace cmdprof::collectors {

static std::string_view trim(std::string_view s) {
  auto issp = [](char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
  while (!s.empty() && issp(s.front())) s.remove_prefix(1);
  while (!s.empty() && issp(s.back())) s.remove_suffix(1);
  return s;
}

std::optional<double> parse_smi_utilization(std::string_view field) {
  auto s = trim(field);
  if (!s.empty() && s.back() == '%') s = trim(s.substr(0, s.size() - 1));
  if (s.empty()) return std::nullopt;
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

GpuReading aggregate_gpu_utilization(const std::vector<std::optional<double>>& per_device) {
  GpuReading r{};
  if (per_device.empty()) return r;
  double total = 0.0;
  for (const auto& d : per_device) total += d.value_or(0.0);
  r.percent = total / static_cast<double>(per_device.size());
  r.available = true;
  return r;
}

static bool is_executable(const std::string& p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

std::string find_nvidia_smi(const std::string& configured) {
  if (!configured.empty() && configured != "auto") {
    return is_executable(configured) ? configured : std::string();
  }
  if (const char* path = std::getenv("PATH"); path && *path) {
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
      size_t end = p.find(':', start);
      std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
      if (!dir.empty()) {
        std::string cand = dir + "/nvidia-smi";
        if (is_executable(cand)) return cand;
      }
      if (end == std::string::npos) break;
      start = end + 1;
    }
  }
  const char* candidates[] = {"/usr/bin/nvidia-smi", "/usr/local/bin/nvidia-smi",
                              "/opt/nvidia/sbin/nvidia-smi", "/bin/nvidia-smi"};
  for (const char* c : candidates) {
    if (is_executable(c)) return c;
  }
  return {};
}

GpuCollector::GpuCollector(const cmdprof::app::GpuConfig& cfg) {
  using cmdprof::app::GpuBackend;
  if (cfg.backend == GpuBackend::None) return;

  if (cfg.backend == GpuBackend::Auto || cfg.backend == GpuBackend::Smi) {
    auto smi = find_nvidia_smi(cfg.smi_path);
    if (!smi.empty()) { kind_ = Kind::Smi; detail_ = smi; return; }
    if (cfg.backend == GpuBackend::Smi) return;
  }

  auto& nvml = cmdprof::util::NvmlDyn::instance();
  nvml.configure(cfg.disable_nvml, cfg.nvml_path);
  if (nvml.load_once() && nvml.available()) {
    kind_ = Kind::Nvml;
    detail_ = "libnvidia-ml";
  }
}

const char* GpuCollector::backend_name() const {
  switch (kind_) {
    case Kind::Smi: return "nvidia-smi";
    case Kind::Nvml: return "nvml";
    case Kind::Absent: break;
  }
  return "none";
}

bool GpuCollector::query_smi(std::vector<std::optional<double>>& per_device) const {
  std::string cmd;
  cmd.reserve(detail_.size() + 96);
  cmd += '\'';
  for (char c : detail_) {
    if (c == '\'') cmd += "'\\''"; else cmd += c;
  }
  cmd += "' --query-gpu=utilization.gpu --format=csv,noheader,nounits 2>/dev/null";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) return false;
  char buf[256];
  while (std::fgets(buf, sizeof(buf), fp)) {
    std::string_view line = trim(buf);
    if (line.empty()) continue;
    per_device.push_back(parse_smi_utilization(line));
  }
  int rc = ::pclose(fp);
  return rc != -1;
}

GpuReading GpuCollector::probe() {
  std::vector<std::optional<double>> per_device;
  switch (kind_) {
    case Kind::Absent:
      return {};
    case Kind::Smi:
      if (!query_smi(per_device)) return {};
      break;
    case Kind::Nvml:
      if (!cmdprof::util::NvmlDyn::instance().read_utilization(per_device)) return {};
      break;
  }
  return aggregate_gpu_utilization(per_device);
}

} // namespace cmdprof::collectors
