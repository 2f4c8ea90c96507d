#include <cstdlib>
#include <iostream>
#include <version.h>

#include "ising/core/args.h"
#include "ising/core/simulation.h"
#include "ising/helpers/error.h"
#include "ising/helpers/output.h"

int main(int argc, char **argv) {
  ising::output::initialise();

  ising::ProgramArgs program_args;
  try {
    program_args = ising::parse_args(argc, argv);
  }
  catch (const std::exception &e) {
    ising::die(e.what(), "\nusage: ising [--version] [--setup-only] [--output=<dir>] [--name=<name>] <config>...");
  }

  if (program_args.version_only) {
    std::cout << "ising-" << ising::build::version << std::endl;
    return EXIT_SUCCESS;
  }

  ising::initialize_simulation(program_args);
  if (!program_args.setup_only) {
    ising::run_simulation();
  }
  ising::cleanup_simulation();

  return EXIT_SUCCESS;
}
