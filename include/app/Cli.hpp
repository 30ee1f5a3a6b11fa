#pragma once

#include <cstdio>
#include <string>
#include <vector>

namespace cmdprof::app {

enum class CliAction { Run, Help, Usage };

// args excludes the program name. A leading -h/--help asks for help; a
// leading "--" is dropped so the command itself may start with '-'.
// Everything else is the command, passed through untouched.
[[nodiscard]] CliAction parse_command_line(const std::vector<std::string>& args,
                                           std::vector<std::string>& command);

void print_usage(std::FILE* out);

// Parse, load the config and run the session. Help and usage errors return
// SETUP_FAILURE_EXIT.
int run_cli(const std::vector<std::string>& args);

} // namespace cmdprof::app
