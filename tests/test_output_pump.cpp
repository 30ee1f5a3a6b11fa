#include "minitest.hpp"
#include "app/LogSink.hpp"
#include "app/OutputPump.hpp"
#include <filesystem>
#include <fstream>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

static std::filesystem::path test_log(const char* suffix) {
  auto p = std::filesystem::temp_directory_path() /
           ("cmdprof_pump_test_" + std::to_string(::getpid()) + "_" + suffix + ".log");
  std::filesystem::remove(p);
  return p;
}

static std::vector<std::string> read_lines(const std::filesystem::path& p) {
  std::ifstream in(p);
  std::vector<std::string> out;
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

static void write_all(int fd, const std::string& s) {
  size_t off = 0;
  while (off < s.size()) {
    ssize_t n = ::write(fd, s.data() + off, s.size() - off);
    if (n <= 0) break;
    off += static_cast<size_t>(n);
  }
}

TEST(pump_preserves_order_and_partial_line) {
  auto p = test_log("order");
  cmdprof::app::LogSink log;
  ASSERT_TRUE(log.open(p, false));
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  cmdprof::app::OutputPump pump(log, fds[0], "stdout", nullptr);
  pump.start();
  write_all(fds[1], "A\nB\r\n");
  write_all(fds[1], "C");
  ::close(fds[1]);
  pump.join();
  ASSERT_EQ(pump.lines(), 3u);
  ASSERT_FALSE(pump.failed());
  log.close();

  auto lines = read_lines(p);
  ASSERT_EQ(lines.size(), 3u);
  const char* expect[] = {"[cmd-stdout] A", "[cmd-stdout] B", "[cmd-stdout] C"};
  for (size_t i = 0; i < 3; ++i) {
    auto pos = lines[i].find(expect[i]);
    ASSERT_TRUE(pos != std::string::npos);
    // the tag ends the line content; no stray carriage return
    ASSERT_EQ(pos + std::string(expect[i]).size(), lines[i].size());
  }
  std::filesystem::remove(p);
}

TEST(pump_keeps_empty_lines) {
  auto p = test_log("empty");
  cmdprof::app::LogSink log;
  ASSERT_TRUE(log.open(p, false));
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  cmdprof::app::OutputPump pump(log, fds[0], "stderr", nullptr);
  pump.start();
  write_all(fds[1], "x\n\ny\n");
  ::close(fds[1]);
  pump.join();
  ASSERT_EQ(pump.lines(), 3u);
  log.close();
  auto lines = read_lines(p);
  ASSERT_EQ(lines.size(), 3u);
  ASSERT_TRUE(lines[1].find("[cmd-stderr] ") != std::string::npos);
  std::filesystem::remove(p);
}

TEST(pump_splits_lines_across_reads) {
  auto p = test_log("chunks");
  cmdprof::app::LogSink log;
  ASSERT_TRUE(log.open(p, false));
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  cmdprof::app::OutputPump pump(log, fds[0], "stdout", nullptr);
  pump.start();
  // larger than one read buffer
  std::string big(10000, 'z');
  write_all(fds[1], big + "\nend\n");
  ::close(fds[1]);
  pump.join();
  ASSERT_EQ(pump.lines(), 2u);
  log.close();
  auto lines = read_lines(p);
  ASSERT_EQ(lines.size(), 2u);
  ASSERT_TRUE(lines[0].find(big) != std::string::npos);
  ASSERT_TRUE(lines[1].find("[cmd-stdout] end") != std::string::npos);
  std::filesystem::remove(p);
}

TEST(pump_empty_stream) {
  auto p = test_log("none");
  cmdprof::app::LogSink log;
  ASSERT_TRUE(log.open(p, false));
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  ::close(fds[1]);
  cmdprof::app::OutputPump pump(log, fds[0], "stdout", nullptr);
  pump.start();
  pump.join();
  ASSERT_EQ(pump.lines(), 0u);
  std::filesystem::remove(p);
}

TEST(pump_read_failure_is_logged) {
  auto p = test_log("readfail");
  cmdprof::app::LogSink log;
  ASSERT_TRUE(log.open(p, false));
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  // reading from the write end fails with EBADF
  cmdprof::app::OutputPump pump(log, fds[1], "stdout", nullptr);
  pump.start();
  pump.join();
  ASSERT_TRUE(pump.failed());
  ASSERT_EQ(pump.lines(), 0u);
  ::close(fds[0]);
  log.close();
  auto lines = read_lines(p);
  ASSERT_EQ(lines.size(), 1u);
  ASSERT_TRUE(lines[0].find("][cmdprof][warn] Error reading stdout: ") != std::string::npos);
  std::filesystem::remove(p);
}

TEST(pump_flushes_long_unterminated_output) {
  auto p = test_log("longline");
  cmdprof::app::LogSink log;
  ASSERT_TRUE(log.open(p, false));
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  cmdprof::app::OutputPump pump(log, fds[0], "stdout", nullptr);
  pump.start();
  const size_t cap = cmdprof::app::OutputPump::kMaxLineBytes;
  write_all(fds[1], std::string(cap + 100, 'r'));

  // the first piece shows up while the writer is still open
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (pump.lines() == 0 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  ASSERT_EQ(pump.lines(), 1u);

  write_all(fds[1], std::string(cap, 's') + "tail\n");
  ::close(fds[1]);
  pump.join();
  // cap 'r' | 100 'r' + (cap - 100) 's' | 100 's' + "tail"
  ASSERT_EQ(pump.lines(), 3u);
  log.close();
  auto lines = read_lines(p);
  ASSERT_EQ(lines.size(), 3u);
  ASSERT_TRUE(lines[0].find(std::string(cap, 'r')) != std::string::npos);
  ASSERT_TRUE(lines[1].find(std::string(100, 'r') + std::string(cap - 100, 's')) != std::string::npos);
  ASSERT_TRUE(lines[2].find("[cmd-stdout] " + std::string(100, 's') + "tail") != std::string::npos);
  std::filesystem::remove(p);
}
