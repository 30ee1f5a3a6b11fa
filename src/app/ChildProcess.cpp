#include "app/ChildProcess.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>

namespace cmdprof::app {

static void close_pair(int p[2]) {
  if (p[0] >= 0) ::close(p[0]);
  if (p[1] >= 0) ::close(p[1]);
  p[0] = p[1] = -1;
}

static pid_t waitpid_retry(pid_t pid, int* status) {
  pid_t r;
  do { r = ::waitpid(pid, status, 0); } while (r < 0 && errno == EINTR);
  return r;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0 && !reaped_) {
    ::kill(pid_, SIGKILL);
    int status = 0;
    waitpid_retry(pid_, &status);
  }
  if (out_fd_ >= 0) ::close(out_fd_);
  if (err_fd_ >= 0) ::close(err_fd_);
}

int ChildProcess::spawn(const std::vector<std::string>& argv) {
  if (argv.empty()) return EINVAL;
  if (pid_ > 0) return EBUSY;

  // argv for execvp is built before fork; the child must not allocate
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  // All pipes are close-on-exec so concurrently spawned helpers (nvidia-smi)
  // never hold a write end open.
  int out[2] = {-1, -1}, err[2] = {-1, -1}, exec_err[2] = {-1, -1};
  if (::pipe2(out, O_CLOEXEC) != 0) return errno;
  if (::pipe2(err, O_CLOEXEC) != 0) { int e = errno; close_pair(out); return e; }
  if (::pipe2(exec_err, O_CLOEXEC) != 0) { int e = errno; close_pair(out); close_pair(err); return e; }

  pid_t pid = ::fork();
  if (pid < 0) {
    int e = errno;
    close_pair(out); close_pair(err); close_pair(exec_err);
    return e;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    ::signal(SIGPIPE, SIG_DFL);
    if (::dup2(out[1], STDOUT_FILENO) < 0 || ::dup2(err[1], STDERR_FILENO) < 0) {
      int e = errno;
      (void)!::write(exec_err[1], &e, sizeof(e));
      ::_exit(127);
    }
    ::execvp(cargv[0], cargv.data());
    int e = errno;
    (void)!::write(exec_err[1], &e, sizeof(e));
    ::_exit(127);
  }

  ::close(out[1]);
  ::close(err[1]);
  ::close(exec_err[1]);

  // EOF here means execvp succeeded and closed the write end.
  int child_errno = 0;
  ssize_t n;
  do { n = ::read(exec_err[0], &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
  ::close(exec_err[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid_retry(pid, &status);
    ::close(out[0]);
    ::close(err[0]);
    return child_errno != 0 ? child_errno : ECHILD;
  }

  pid_ = pid;
  out_fd_ = out[0];
  err_fd_ = err[0];
  return 0;
}

int ChildProcess::release_stdout() {
  int fd = out_fd_;
  out_fd_ = -1;
  return fd;
}

int ChildProcess::release_stderr() {
  int fd = err_fd_;
  err_fd_ = -1;
  return fd;
}

int ChildProcess::wait() {
  if (pid_ <= 0 || reaped_) return -1;
  int status = 0;
  if (waitpid_retry(pid_, &status) < 0) return -1;
  reaped_ = true;
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) {
    signaled_ = true;
    term_signal_ = WTERMSIG(status);
    return 128 + term_signal_;
  }
  return -1;
}

} // namespace cmdprof::app
