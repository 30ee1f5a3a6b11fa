#include "app/OutputPump.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string_view>
#include <utility>

namespace cmdprof::app {

OutputPump::OutputPump(LogSink& log, int fd, std::string name, std::FILE* mirror)
    : log_(log), fd_(fd), name_(std::move(name)), mirror_(mirror) {}

OutputPump::~OutputPump() {
  join();
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

void OutputPump::start() {
  if (thread_.joinable() || fd_ < 0) return;
  thread_ = std::jthread([this]{ run(); });
}

void OutputPump::join() {
  if (thread_.joinable()) thread_.join();
}

void OutputPump::emit(std::string_view line) {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  log_.output_line(name_, line, mirror_);
  lines_.fetch_add(1);
}

void OutputPump::run() {
  std::string pending;
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      failed_.store(true);
      log_.warnf("Error reading %s: %s", name_.c_str(), std::strerror(err));
      break;
    }
    if (n == 0) break;
    pending.append(buf, static_cast<size_t>(n));
    size_t start = 0;
    while (true) {
      size_t nl = pending.find('\n', start);
      size_t len = (nl == std::string::npos ? pending.size() : nl) - start;
      // Runs without newlines (progress bars, binary data) are flushed in
      // cap-sized pieces instead of buffering until EOF.
      if (len > kMaxLineBytes) {
        emit(std::string_view(pending).substr(start, kMaxLineBytes));
        start += kMaxLineBytes;
        continue;
      }
      if (nl == std::string::npos) break;
      emit(std::string_view(pending).substr(start, len));
      start = nl + 1;
    }
    pending.erase(0, start);
  }
  // final line without a trailing newline
  if (!pending.empty()) emit(pending);
  ::close(fd_);
  fd_ = -1;
}

} // namespace cmdprof::app
