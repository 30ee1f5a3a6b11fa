#pragma once
#include <optional>
#include <string>
#include <vector>

namespace cmdprof::util {

// Lightweight runtime NVML loader (dlopen/dlsym).
// Avoids build-time dependency on nvml.h; a host without the driver simply
// reports the library as unavailable.
class NvmlDyn {
public:
  // Singleton accessor
  static NvmlDyn& instance();

  // Must be called before the first load_once() to take effect.
  void configure(bool disabled, std::string library_path);

  // Attempt to load libnvidia-ml once (idempotent).
  bool load_once();

  // True if library is loaded and core symbols are present.
  bool available() const;

  // Per-device GPU utilization percent. A device whose query fails is left
  // empty. Returns false when NVML cannot be initialized at all.
  bool read_utilization(std::vector<std::optional<double>>& per_device);

private:
  NvmlDyn() = default;
  NvmlDyn(const NvmlDyn&) = delete;
  NvmlDyn& operator=(const NvmlDyn&) = delete;

  void* handle_{};
  bool loaded_{false};
  bool suppressed_{false};
  std::string library_path_;

  using nvmlReturn_t = int; // NVML_SUCCESS == 0
  using nvmlDevice_t = void*;
  struct nvmlUtilization_t { unsigned int gpu, memory; };

  nvmlReturn_t (*p_nvmlInit_v2)(){};
  nvmlReturn_t (*p_nvmlShutdown)(){};
  nvmlReturn_t (*p_nvmlDeviceGetCount_v2)(unsigned int* count){};
  nvmlReturn_t (*p_nvmlDeviceGetHandleByIndex_v2)(unsigned int index, nvmlDevice_t* device){};
  nvmlReturn_t (*p_nvmlDeviceGetUtilizationRates)(nvmlDevice_t device, nvmlUtilization_t* utilization){};

  bool dlsym_all();
};

} // namespace cmdprof::util
