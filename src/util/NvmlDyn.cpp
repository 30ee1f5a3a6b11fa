#include "util/NvmlDyn.hpp"
#include <cstdio>
#include <dlfcn.h>
#include <string>
#include <utility>
#include <vector>

namespace cmdprof::util {

static const int NVML_SUCCESS = 0;

NvmlDyn& NvmlDyn::instance() {
  static NvmlDyn inst;
  return inst;
}

void NvmlDyn::configure(bool disabled, std::string library_path) {
  if (loaded_) return;
  suppressed_ = disabled;
  library_path_ = std::move(library_path);
}

bool NvmlDyn::load_once() {
  if (loaded_) return handle_ != nullptr;
  loaded_ = true;
  if (suppressed_) return false;

  std::vector<std::string> candidates;

  if (!library_path_.empty()) {
    static const std::vector<std::string> allowed_prefixes = {
      "/usr/lib", "/usr/lib64", "/usr/local/lib", "/usr/local/lib64",
      "/opt/nvidia", "/opt/cuda"
    };
    bool valid = false;
    for (const auto& prefix : allowed_prefixes) {
      if (library_path_.rfind(prefix, 0) == 0) { valid = true; break; }
    }
    if (valid) {
      candidates.emplace_back(library_path_);
    } else {
      std::fprintf(stderr, "cmdprof: NVML library path rejected (invalid prefix): %s\n", library_path_.c_str());
    }
  }

  candidates.emplace_back("libnvidia-ml.so.1");
  candidates.emplace_back("libnvidia-ml.so");

  for (const auto& lib : candidates) {
    handle_ = ::dlopen(lib.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (handle_) break;
  }
  if (!handle_) return false;
  if (!dlsym_all()) {
    ::dlclose(handle_); handle_ = nullptr; return false;
  }
  return true;
}

bool NvmlDyn::dlsym_all() {
  auto L = [&](const char* sym){ return ::dlsym(handle_, sym); };
  p_nvmlInit_v2 = (nvmlReturn_t (*)())L("nvmlInit_v2");
  p_nvmlShutdown = (nvmlReturn_t (*)())L("nvmlShutdown");
  p_nvmlDeviceGetCount_v2 = (nvmlReturn_t (*)(unsigned int*))L("nvmlDeviceGetCount_v2");
  p_nvmlDeviceGetHandleByIndex_v2 = (nvmlReturn_t (*)(unsigned int, nvmlDevice_t*))L("nvmlDeviceGetHandleByIndex_v2");
  p_nvmlDeviceGetUtilizationRates = (nvmlReturn_t (*)(nvmlDevice_t, nvmlUtilization_t*))L("nvmlDeviceGetUtilizationRates");
  return p_nvmlInit_v2 && p_nvmlShutdown && p_nvmlDeviceGetCount_v2 && p_nvmlDeviceGetHandleByIndex_v2 &&
         p_nvmlDeviceGetUtilizationRates;
}

bool NvmlDyn::available() const { return handle_ != nullptr && !suppressed_; }

bool NvmlDyn::read_utilization(std::vector<std::optional<double>>& per_device) {
  per_device.clear();
  if (!load_once() || !available()) return false;
  if (p_nvmlInit_v2() != NVML_SUCCESS) return false;

  unsigned int n = 0;
  if (p_nvmlDeviceGetCount_v2(&n) != NVML_SUCCESS) { p_nvmlShutdown(); return false; }

  for (unsigned int i = 0; i < n; ++i) {
    nvmlDevice_t dev{};
    nvmlUtilization_t ur{};
    if (p_nvmlDeviceGetHandleByIndex_v2(i, &dev) == NVML_SUCCESS &&
        p_nvmlDeviceGetUtilizationRates(dev, &ur) == NVML_SUCCESS) {
      per_device.emplace_back(static_cast<double>(ur.gpu));
    } else {
      per_device.emplace_back(std::nullopt);
    }
  }
  p_nvmlShutdown();
  return true;
}

} // namespace cmdprof::util
