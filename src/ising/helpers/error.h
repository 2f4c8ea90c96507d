#ifndef ISING_HELPERS_ERROR_H
#define ISING_HELPERS_ERROR_H

#include <cstdlib>
#include <iostream>

#include "ising/core/simulation.h"

namespace ising {
  // Print the reason and details to stderr, release the simulation and exit.
  template <class ... Args>
  [[noreturn]] void die(const char* reason, Args && ... details) {

    std::cerr << "\n" << reason << "\n";
    ([&]{
      std::cerr << details;
    } (), ...);
    std::cerr << std::endl;

    ising::cleanup_simulation();
    std::exit(EXIT_FAILURE);
  }
}

void ising_warning(const char *message, ...);

#endif
