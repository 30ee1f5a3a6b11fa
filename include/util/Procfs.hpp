// Helpers for reading /proc with an optional fixture root
#pragma once
#include <string>
#include <optional>

namespace cmdprof::util {

// Map an absolute /proc path to an alternate root if CMDPROF_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// True if the (mapped) path exists and is readable by this process.
auto proc_readable(const std::string& abs) -> bool;

} // namespace cmdprof::util
