#include "app/Cli.hpp"

#include <csignal>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  // A closed terminal must not kill the wrapper mid-summary.
  std::signal(SIGPIPE, SIG_IGN);
  std::vector<std::string> args(argv + 1, argv + argc);
  return cmdprof::app::run_cli(args);
}
