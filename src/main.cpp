#include <csignal>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

#include "cli/app.hpp"

namespace {

void on_interrupt(int /*sig*/) {
  const char nl = '\n';
  // Only async-signal-safe calls here.
  [[maybe_unused]] const auto n = ::write(STDERR_FILENO, &nl, 1);
  std::_Exit(ccwc::kExitInterrupted);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, on_interrupt);
  std::ios::sync_with_stdio(false);
  return ccwc::run_cli(argc, argv, std::cin, std::cout, std::cerr);
}
