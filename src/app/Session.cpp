#include "app/Session.hpp"
#include "app/ChildProcess.hpp"
#include "app/LogSink.hpp"
#include "app/OutputPump.hpp"
#include "app/Report.hpp"
#include "app/Sampler.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/GpuCollector.hpp"
#include "util/Formatting.hpp"
#include "util/Procfs.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <thread>

using namespace std::chrono;

namespace cmdprof::app {

static std::atomic<pid_t> g_child_pid{0};

// Terminal-generated SIGINT/SIGQUIT already reach the child through the
// process group; survive them so the summary is still written. SIGTERM and
// SIGHUP are aimed at us alone and are passed on.
static void on_forward_signal(int sig) {
  pid_t p = g_child_pid.load();
  if (p > 0 && (sig == SIGTERM || sig == SIGHUP)) ::kill(p, sig);
}

namespace {

class SignalForwarder {
public:
  explicit SignalForwarder(pid_t child) {
    g_child_pid.store(child);
    struct sigaction sa{};
    sa.sa_handler = on_forward_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (size_t i = 0; i < kCount; ++i) ::sigaction(kSignals[i], &sa, &saved_[i]);
  }
  ~SignalForwarder() {
    for (size_t i = 0; i < kCount; ++i) ::sigaction(kSignals[i], &saved_[i], nullptr);
    g_child_pid.store(0);
  }
  SignalForwarder(const SignalForwarder&) = delete;
  SignalForwarder& operator=(const SignalForwarder&) = delete;

private:
  static constexpr int kSignals[] = {SIGINT, SIGQUIT, SIGTERM, SIGHUP};
  static constexpr size_t kCount = sizeof(kSignals) / sizeof(kSignals[0]);
  struct sigaction saved_[kCount]{};
};

} // namespace

bool counters_supported() {
#ifdef __linux__
  return cmdprof::util::proc_readable("/proc/stat") && cmdprof::util::proc_readable("/proc/meminfo");
#else
  return false;
#endif
}

static std::string join_command(const std::vector<std::string>& command) {
  std::string s;
  for (const auto& a : command) {
    if (!s.empty()) s += ' ';
    s += a;
  }
  return s;
}

int run_session(const Config& cfg, const std::vector<std::string>& command) {
  if (command.empty()) {
    std::fprintf(stderr, "cmdprof: no command given\n");
    return SETUP_FAILURE_EXIT;
  }
  if (!counters_supported()) {
    std::fprintf(stderr, "cmdprof: unsupported platform: %s and %s must be readable\n",
                 cmdprof::util::map_proc_path("/proc/stat").c_str(),
                 cmdprof::util::map_proc_path("/proc/meminfo").c_str());
    return SETUP_FAILURE_EXIT;
  }

  LogSink log;
  if (!log.open(cfg.log.path, cfg.log.echo)) {
    int e = errno;
    std::fprintf(stderr, "cmdprof: failed to open log file %s: %s\n", cfg.log.path.c_str(), std::strerror(e));
    return SETUP_FAILURE_EXIT;
  }

  cmdprof::model::CpuCounters baseline{};
  if (auto st = cmdprof::collectors::read_cpu_counters(baseline); st != cmdprof::model::CounterStatus::Ok) {
    std::fprintf(stderr, "cmdprof: failed to read CPU counters: %s\n", cmdprof::model::to_string(st));
    return SETUP_FAILURE_EXIT;
  }

  cmdprof::collectors::GpuCollector gpu(cfg.gpu);
  SamplerSettings settings{milliseconds(cfg.sampler.interval_ms), milliseconds(cfg.sampler.baseline_ms)};

  log.separator();
  log.logf("=========================================");
  log.logf("Starting command: %s", join_command(command).c_str());
  if (gpu.present()) log.logf("GPU probe: %s (%s)", gpu.backend_name(), gpu.detail().c_str());

  Sampler sampler(log, gpu, settings);
  sampler.start(baseline);
  log.logf("Collecting baseline...");
  std::this_thread::sleep_for(settings.warmup());

  ChildProcess child;
  if (int err = child.spawn(command); err != 0) {
    sampler.stop();
    log.logf("Failed to start command: %s", std::strerror(err));
    if (!cfg.log.echo) std::fprintf(stderr, "cmdprof: failed to start %s: %s\n", command[0].c_str(), std::strerror(err));
    return SETUP_FAILURE_EXIT;
  }
  auto started = steady_clock::now();
  log.logf("Started command! (pid %d)", static_cast<int>(child.pid()));

  int code = 0;
  int wait_errno = 0;
  {
    SignalForwarder forward(child.pid());
    OutputPump out(log, child.release_stdout(), "stdout", stdout);
    OutputPump err(log, child.release_stderr(), "stderr", stderr);
    out.start();
    err.start();
    // Pipes may still hold output after the child exits; drain both first.
    out.join();
    err.join();
    code = child.wait();
    if (code < 0) wait_errno = errno;
  }
  sampler.stop();
  auto elapsed = steady_clock::now() - started;

  log.logf("-----------------------------------------");
  if (code < 0) {
    log.warnf("Failed to collect the command's exit status: %s", std::strerror(wait_errno));
    code = SETUP_FAILURE_EXIT;
  } else if (child.signaled()) {
    log.logf("Command terminated by signal %d (%s)", child.term_signal(), ::strsignal(child.term_signal()));
  } else {
    log.logf("Command exited with code %d", code);
  }
  for (const auto& line : format_summary(sampler.aggregates(), gpu.present())) {
    log.logf("%s", line.c_str());
  }
  log.logf("Total Execution Time: %s", cmdprof::util::format_elapsed(elapsed).c_str());
  log.logf("=============== FINISHED ================");
  return code;
}

} // namespace cmdprof::app
