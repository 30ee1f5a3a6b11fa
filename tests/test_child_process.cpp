#include "minitest.hpp"
#include "app/ChildProcess.hpp"
#include <cerrno>
#include <csignal>
#include <string>
#include <unistd.h>

static std::string drain(int fd) {
  std::string out;
  char buf[256];
  ssize_t n;
  while ((n = ::read(fd, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
  ::close(fd);
  return out;
}

TEST(child_exit_code_and_streams) {
  cmdprof::app::ChildProcess child;
  ASSERT_EQ(child.spawn({"/bin/sh", "-c", "echo out; echo err >&2; exit 7"}), 0);
  ASSERT_TRUE(child.pid() > 0);
  auto out = drain(child.release_stdout());
  auto err = drain(child.release_stderr());
  ASSERT_EQ(out, "out\n");
  ASSERT_EQ(err, "err\n");
  ASSERT_EQ(child.wait(), 7);
  ASSERT_FALSE(child.signaled());
}

TEST(child_path_lookup) {
  cmdprof::app::ChildProcess child;
  ASSERT_EQ(child.spawn({"sh", "-c", "exit 0"}), 0);
  ::close(child.release_stdout());
  ::close(child.release_stderr());
  ASSERT_EQ(child.wait(), 0);
}

TEST(child_missing_command_reports_errno) {
  cmdprof::app::ChildProcess child;
  ASSERT_EQ(child.spawn({"/nonexistent/cmdprof-no-such-binary"}), ENOENT);
}

TEST(child_empty_argv_rejected) {
  cmdprof::app::ChildProcess child;
  ASSERT_NE(child.spawn({}), 0);
}

TEST(child_killed_by_signal) {
  cmdprof::app::ChildProcess child;
  ASSERT_EQ(child.spawn({"/bin/sh", "-c", "kill -TERM $$"}), 0);
  ::close(child.release_stdout());
  ::close(child.release_stderr());
  ASSERT_EQ(child.wait(), 128 + SIGTERM);
  ASSERT_TRUE(child.signaled());
  ASSERT_EQ(child.term_signal(), SIGTERM);
}

TEST(child_destructor_reaps_running_child) {
  pid_t pid = -1;
  {
    cmdprof::app::ChildProcess child;
    ASSERT_EQ(child.spawn({"/bin/sh", "-c", "sleep 30"}), 0);
    pid = child.pid();
  }
  // reaped: the pid no longer names our child
  ASSERT_EQ(::kill(pid, 0), -1);
}
