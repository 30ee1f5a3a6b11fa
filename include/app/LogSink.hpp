#pragma once

#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace cmdprof::app {

// Append-only run log shared by the sampler and both output readers.
// Every line is formatted, written and flushed under one lock, so concurrent
// writers interleave by whole lines.
class LogSink {
public:
  LogSink() = default;
  ~LogSink();
  LogSink(const LogSink&) = delete;
  LogSink& operator=(const LogSink&) = delete;

  // Opens (creating if needed) in append mode. With echo, tool lines are
  // also written to stderr.
  [[nodiscard]] bool open(const std::filesystem::path& path, bool echo);
  void close();
  bool is_open() const { return file_.is_open(); }
  const std::filesystem::path& path() const { return path_; }

  // Run separator (a bare newline, not echoed).
  void separator();

  // "[stamp][cmdprof] message"
  void logf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
  // "[stamp][cmdprof][warn] message" for recovered errors.
  void warnf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

  // "[stamp][cmd-<stream>] text" to the mirror and the log.
  void output_line(std::string_view stream, std::string_view text, std::FILE* mirror);

private:
  void write_tool_line(const char* tag, const char* fmt, va_list ap);

  std::mutex mu_;
  std::ofstream file_;
  std::filesystem::path path_;
  bool echo_{false};
};

} // namespace cmdprof::app
