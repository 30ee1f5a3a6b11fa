#pragma once

#include <string>

namespace cmdprof::util { class TomlReader; }

namespace cmdprof::app {

struct SamplerConfig {
  int interval_ms{250};
  int baseline_ms{1000};
};

struct LogConfig {
  std::string path{"cmdprof.log"};
  bool echo{true};
};

enum class GpuBackend { Auto, Smi, Nvml, None };

struct GpuConfig {
  GpuBackend backend{GpuBackend::Auto};
  std::string smi_path{"auto"};
  bool disable_nvml{false};
  std::string nvml_path;
};

struct Config {
  SamplerConfig sampler;
  LogConfig log;
  GpuConfig gpu;
};

// Resolve every key TOML -> env -> compiled default. The file is
// $CMDPROF_CONFIG, else the XDG location; a missing file is not an error.
Config load_config();

// Same resolution against an already parsed file (or none when toml is null).
Config resolve_config(const cmdprof::util::TomlReader* toml);

std::string config_file_path();

// Environment variable helpers (accept CMDPROF_ and cmdprof_ prefixes)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

const char* to_string(GpuBackend b);
bool parse_gpu_backend(const std::string& s, GpuBackend& out);

} // namespace cmdprof::app
