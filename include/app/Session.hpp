#pragma once

#include <string>
#include <vector>
#include "app/Config.hpp"

namespace cmdprof::app {

// Exit code for failures before the command ran: usage, unsupported platform,
// log open, baseline counter read, spawn.
inline constexpr int SETUP_FAILURE_EXIT = 125;

// Linux with readable /proc/stat and /proc/meminfo.
[[nodiscard]] bool counters_supported();

// Runs command to completion under sampling and appends the run to the log.
// Returns the command's exit code (128 + signal if it was killed), or
// SETUP_FAILURE_EXIT.
[[nodiscard]] int run_session(const Config& cfg, const std::vector<std::string>& command);

} // namespace cmdprof::app
