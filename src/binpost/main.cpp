#include "binpost/cli/router.hpp"

int main(int argc, char** argv) {
  // Subcommand parsing, the run summary and the exit-code contract all live in
  // the CLI router.
  return binpost::cli::Dispatch(argc, argv);
}
