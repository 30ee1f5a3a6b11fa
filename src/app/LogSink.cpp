#include "app/LogSink.hpp"
#include "util/Formatting.hpp"

#include <cstdarg>
#include <string>

namespace cmdprof::app {

LogSink::~LogSink() { close(); }

bool LogSink::open(const std::filesystem::path& path, bool echo) {
  std::lock_guard<std::mutex> lk(mu_);
  file_.open(path, std::ios::out | std::ios::app);
  if (!file_) return false;
  path_ = path;
  echo_ = echo;
  return true;
}

void LogSink::close() {
  std::lock_guard<std::mutex> lk(mu_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void LogSink::separator() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!file_.is_open()) return;
  file_.put('\n');
  file_.flush();
}

void LogSink::write_tool_line(const char* tag, const char* fmt, va_list ap) {
  char small[512];
  va_list ap2;
  va_copy(ap2, ap);
  int n = std::vsnprintf(small, sizeof(small), fmt, ap);
  std::string msg;
  if (n < 0) {
    msg = fmt;
  } else if (static_cast<size_t>(n) < sizeof(small)) {
    msg.assign(small, static_cast<size_t>(n));
  } else {
    msg.resize(static_cast<size_t>(n) + 1);
    std::vsnprintf(msg.data(), msg.size(), fmt, ap2);
    msg.resize(static_cast<size_t>(n));
  }
  va_end(ap2);

  std::string line = "[" + cmdprof::util::format_stamp_now() + "]" + tag + " " + msg + "\n";
  std::lock_guard<std::mutex> lk(mu_);
  if (file_.is_open()) {
    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_.flush();
  }
  if (echo_) {
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
}

void LogSink::logf(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  write_tool_line("[cmdprof]", fmt, ap);
  va_end(ap);
}

void LogSink::warnf(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  write_tool_line("[cmdprof][warn]", fmt, ap);
  va_end(ap);
}

void LogSink::output_line(std::string_view stream, std::string_view text, std::FILE* mirror) {
  std::string line;
  line.reserve(text.size() + 48);
  line += '[';
  line += cmdprof::util::format_stamp_now();
  line += "][cmd-";
  line += stream;
  line += "] ";
  line += text;
  line += '\n';
  std::lock_guard<std::mutex> lk(mu_);
  if (mirror) {
    std::fwrite(line.data(), 1, line.size(), mirror);
    std::fflush(mirror);
  }
  if (file_.is_open()) {
    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_.flush();
  }
}

} // namespace cmdprof::app
