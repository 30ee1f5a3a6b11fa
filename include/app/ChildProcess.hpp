#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace cmdprof::app {

// A spawned command with its stdout and stderr connected to pipes. stdin is
// inherited. An unreaped child is killed and reaped on destruction.
class ChildProcess {
public:
  ChildProcess() = default;
  ~ChildProcess();
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Runs argv[0] (PATH lookup) with argv. Returns 0 on success, otherwise the
  // errno of the step that failed; an execvp failure in the child is
  // reported back through a close-on-exec pipe.
  [[nodiscard]] int spawn(const std::vector<std::string>& argv);

  // Hand the read ends over to their readers.
  int release_stdout();
  int release_stderr();

  pid_t pid() const { return pid_; }

  // Blocks until the child exits. Returns its exit code, 128 + signal number
  // when it was killed by a signal, or -1 if waiting failed.
  int wait();

  bool signaled() const { return signaled_; }
  int term_signal() const { return term_signal_; }

private:
  pid_t pid_{-1};
  int out_fd_{-1};
  int err_fd_{-1};
  bool reaped_{false};
  bool signaled_{false};
  int term_signal_{0};
};

} // namespace cmdprof::app
