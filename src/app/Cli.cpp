#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/Session.hpp"

namespace cmdprof::app {

CliAction parse_command_line(const std::vector<std::string>& args, std::vector<std::string>& command) {
  command.clear();
  size_t i = 0;
  if (i < args.size()) {
    const auto& a = args[i];
    if (a == "-h" || a == "--help") return CliAction::Help;
    if (a == "--") ++i;
  }
  for (; i < args.size(); ++i) command.push_back(args[i]);
  return command.empty() ? CliAction::Usage : CliAction::Run;
}

void print_usage(std::FILE* out) {
  std::fprintf(out,
    "Usage: cmdprof [--] <command> [args...]\n"
    "Runs <command>, samples CPU, memory and GPU utilization while it runs,\n"
    "and appends the run with a min/max/avg summary to the log file.\n"
    "\n"
    "Configuration (config.toml key, environment variable, default):\n"
    "  sampler.interval_ms  CMDPROF_INTERVAL_MS      250\n"
    "  sampler.baseline_ms  CMDPROF_BASELINE_MS      1000\n"
    "  log.path             CMDPROF_LOG_PATH         cmdprof.log\n"
    "  log.echo             CMDPROF_LOG_ECHO         true\n"
    "  gpu.backend          CMDPROF_GPU_BACKEND      auto (smi, nvml, none)\n"
    "  gpu.smi_path         CMDPROF_NVIDIA_SMI_PATH  auto\n"
    "  gpu.disable_nvml     CMDPROF_DISABLE_NVML     false\n"
    "  gpu.nvml_path        CMDPROF_NVML_PATH\n"
    "Config file: $CMDPROF_CONFIG, else $XDG_CONFIG_HOME/cmdprof/config.toml\n"
    "or ~/.config/cmdprof/config.toml.\n");
}

int run_cli(const std::vector<std::string>& args) {
  std::vector<std::string> command;
  switch (parse_command_line(args, command)) {
    case CliAction::Help:
      print_usage(stdout);
      return SETUP_FAILURE_EXIT;
    case CliAction::Usage:
      std::fprintf(stderr, "cmdprof: no command given\n");
      print_usage(stderr);
      return SETUP_FAILURE_EXIT;
    case CliAction::Run:
      break;
  }
  auto cfg = load_config();
  return run_session(cfg, command);
}

} // namespace cmdprof::app
