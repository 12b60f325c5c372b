#include "netdiag/cli/router.hpp"

int main(int argc, char** argv) {
  // Keep the process entrypoint thin. Command parsing and exit-code contracts
  // live in the CLI router.
  return netdiag::cli::Dispatch(argc, argv);
}
