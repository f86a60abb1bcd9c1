#include "hostgate/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // a closed stdout in serve mode must not kill the process
  std::signal(SIGPIPE, SIG_IGN);
  return hostgate::cli::run_cli(argc, argv);
}
