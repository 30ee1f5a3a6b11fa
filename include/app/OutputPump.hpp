#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <thread>
#include "app/LogSink.hpp"

namespace cmdprof::app {

// Drains one child output pipe line by line on its own thread. Each line is
// stamped, tagged with the stream name and written to the mirror and the log
// before the next read. The pump owns the fd and closes it when done.
class OutputPump {
public:
  // Longest line emitted as one entry; longer runs are split into pieces.
  static constexpr size_t kMaxLineBytes = 64 * 1024;

  OutputPump(LogSink& log, int fd, std::string name, std::FILE* mirror);
  ~OutputPump();
  OutputPump(const OutputPump&) = delete;
  OutputPump& operator=(const OutputPump&) = delete;

  void start();
  // Blocks until the pipe reaches end-of-input or fails.
  void join();

  uint64_t lines() const { return lines_.load(); }
  bool failed() const { return failed_.load(); }

private:
  void run();
  void emit(std::string_view line);

  LogSink& log_;
  int fd_;
  std::string name_;
  std::FILE* mirror_;
  std::atomic<uint64_t> lines_{0};
  std::atomic<bool> failed_{false};
  std::jthread thread_{};
};

} // namespace cmdprof::app
