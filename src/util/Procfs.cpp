#include "util/Procfs.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace cmdprof::util {

static std::string proc_root() {
  const char* env = std::getenv("CMDPROF_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // procfs reports read errors through the stream state, not exceptions
  if (in.bad()) return std::nullopt;
  return s;
}

auto proc_readable(const std::string& abs) -> bool {
  return ::access(map_proc_path(abs).c_str(), R_OK) == 0;
}

} // namespace cmdprof::util
