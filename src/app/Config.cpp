#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace cmdprof::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("CMDPROF_", 0) == 0) {
    alt = std::string("cmdprof_") + n.substr(8);
  } else if (n.rfind("cmdprof_", 0) == 0) {
    alt = std::string("CMDPROF_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch(...) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

const char* to_string(GpuBackend b) {
  switch (b) {
    case GpuBackend::Auto: return "auto";
    case GpuBackend::Smi: return "smi";
    case GpuBackend::Nvml: return "nvml";
    case GpuBackend::None: return "none";
  }
  return "auto";
}

bool parse_gpu_backend(const std::string& s, GpuBackend& out) {
  std::string v = s;
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (v == "auto") { out = GpuBackend::Auto; return true; }
  if (v == "smi" || v == "nvidia-smi") { out = GpuBackend::Smi; return true; }
  if (v == "nvml") { out = GpuBackend::Nvml; return true; }
  if (v == "none" || v == "off") { out = GpuBackend::None; return true; }
  return false;
}

std::string config_file_path() {
  if (const char* p = std::getenv("CMDPROF_CONFIG"); p && *p)
    return std::string(p);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/cmdprof/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/cmdprof/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const cmdprof::util::TomlReader* toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (toml && toml->has(section, key))
    return toml->get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const cmdprof::util::TomlReader* toml, const char* section, const char* key,
                         const char* env_name, bool def) {
  if (toml && toml->has(section, key))
    return toml->get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const cmdprof::util::TomlReader* toml, const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (toml && toml->has(section, key))
    return toml->get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config resolve_config(const cmdprof::util::TomlReader* toml) {
  Config c{};

  // --- [sampler] ---
  c.sampler.interval_ms = std::clamp(resolve_int(toml, "sampler", "interval_ms", "CMDPROF_INTERVAL_MS", 250), 10, 60000);
  c.sampler.baseline_ms = std::clamp(resolve_int(toml, "sampler", "baseline_ms", "CMDPROF_BASELINE_MS", 1000), 0, 60000);

  // --- [log] ---
  c.log.path = resolve_string(toml, "log", "path", "CMDPROF_LOG_PATH", "cmdprof.log");
  if (c.log.path.empty()) c.log.path = "cmdprof.log";
  c.log.echo = resolve_bool(toml, "log", "echo", "CMDPROF_LOG_ECHO", true);

  // --- [gpu] ---
  auto backend = resolve_string(toml, "gpu", "backend", "CMDPROF_GPU_BACKEND", "auto");
  if (!parse_gpu_backend(backend, c.gpu.backend)) {
    std::fprintf(stderr, "cmdprof: unknown gpu backend '%s', using auto\n", backend.c_str());
    c.gpu.backend = GpuBackend::Auto;
  }
  c.gpu.smi_path     = resolve_string(toml, "gpu", "smi_path", "CMDPROF_NVIDIA_SMI_PATH", "auto");
  c.gpu.disable_nvml = resolve_bool(toml, "gpu", "disable_nvml", "CMDPROF_DISABLE_NVML", false);
  c.gpu.nvml_path    = resolve_string(toml, "gpu", "nvml_path", "CMDPROF_NVML_PATH", "");

  return c;
}

Config load_config() {
  cmdprof::util::TomlReader toml;
  auto path = config_file_path();
  bool have_toml = !path.empty() && toml.load(path);
  return resolve_config(have_toml ? &toml : nullptr);
}

} // namespace cmdprof::app
