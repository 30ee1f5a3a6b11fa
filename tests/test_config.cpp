#include "minitest.hpp"
#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <string>

using cmdprof::app::GpuBackend;

static void clear_env() {
  const char* names[] = {"CMDPROF_INTERVAL_MS", "CMDPROF_BASELINE_MS", "CMDPROF_LOG_PATH", "CMDPROF_LOG_ECHO",
                         "CMDPROF_GPU_BACKEND", "CMDPROF_NVIDIA_SMI_PATH", "CMDPROF_DISABLE_NVML",
                         "CMDPROF_NVML_PATH", "cmdprof_INTERVAL_MS"};
  for (const char* n : names) ::unsetenv(n);
}

TEST(config_defaults) {
  clear_env();
  auto c = cmdprof::app::resolve_config(nullptr);
  ASSERT_EQ(c.sampler.interval_ms, 250);
  ASSERT_EQ(c.sampler.baseline_ms, 1000);
  ASSERT_EQ(c.log.path, "cmdprof.log");
  ASSERT_TRUE(c.log.echo);
  ASSERT_TRUE(c.gpu.backend == GpuBackend::Auto);
  ASSERT_EQ(c.gpu.smi_path, "auto");
  ASSERT_FALSE(c.gpu.disable_nvml);
}

TEST(config_env_overrides_default) {
  clear_env();
  ::setenv("CMDPROF_INTERVAL_MS", "100", 1);
  ::setenv("CMDPROF_LOG_ECHO", "0", 1);
  ::setenv("CMDPROF_GPU_BACKEND", "none", 1);
  auto c = cmdprof::app::resolve_config(nullptr);
  ASSERT_EQ(c.sampler.interval_ms, 100);
  ASSERT_FALSE(c.log.echo);
  ASSERT_TRUE(c.gpu.backend == GpuBackend::None);
  clear_env();
}

TEST(config_toml_overrides_env) {
  clear_env();
  ::setenv("CMDPROF_INTERVAL_MS", "100", 1);
  ::setenv("CMDPROF_LOG_PATH", "env.log", 1);
  cmdprof::util::TomlReader tr;
  tr.parse("[sampler]\ninterval_ms = 500\n[gpu]\nbackend = nvml\n");
  auto c = cmdprof::app::resolve_config(&tr);
  ASSERT_EQ(c.sampler.interval_ms, 500);
  ASSERT_EQ(c.log.path, "env.log");
  ASSERT_TRUE(c.gpu.backend == GpuBackend::Nvml);
  clear_env();
}

TEST(config_clamps_and_lowercase_prefix) {
  clear_env();
  ::setenv("cmdprof_INTERVAL_MS", "1", 1);
  ::setenv("CMDPROF_BASELINE_MS", "-5", 1);
  auto c = cmdprof::app::resolve_config(nullptr);
  ASSERT_EQ(c.sampler.interval_ms, 10);
  ASSERT_EQ(c.sampler.baseline_ms, 0);
  clear_env();
}

TEST(config_unknown_backend_falls_back) {
  clear_env();
  cmdprof::util::TomlReader tr;
  tr.parse("[gpu]\nbackend = quantum\n");
  auto c = cmdprof::app::resolve_config(&tr);
  ASSERT_TRUE(c.gpu.backend == GpuBackend::Auto);
}

TEST(config_backend_names) {
  GpuBackend b{};
  ASSERT_TRUE(cmdprof::app::parse_gpu_backend("NVIDIA-SMI", b));
  ASSERT_TRUE(b == GpuBackend::Smi);
  ASSERT_TRUE(cmdprof::app::parse_gpu_backend("off", b));
  ASSERT_TRUE(b == GpuBackend::None);
  ASSERT_FALSE(cmdprof::app::parse_gpu_backend("", b));
  ASSERT_EQ(std::string(cmdprof::app::to_string(GpuBackend::Nvml)), "nvml");
}

TEST(config_file_path_prefers_explicit) {
  ::setenv("CMDPROF_CONFIG", "/tmp/cmdprof_explicit.toml", 1);
  ASSERT_EQ(cmdprof::app::config_file_path(), "/tmp/cmdprof_explicit.toml");
  ::unsetenv("CMDPROF_CONFIG");
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  ASSERT_EQ(cmdprof::app::config_file_path(), "/tmp/xdg/cmdprof/config.toml");
}
