// init_dispatcher.h                                                   -*-C++-*-
#ifndef ISING_INITIALIZER_INIT_DISPATCHER_H
#define ISING_INITIALIZER_INIT_DISPATCHER_H

#include <libconfig.h++>

#include "ising/core/lattice.h"
#include "ising/helpers/random.h"

namespace ising {
  // Sets the starting spin configuration from the "initializer" settings
  // group. The `module` setting selects the initializer.
  class InitializerDispatcher {
  public:
      static void execute(const libconfig::Setting &settings, Lattice& lattice,
                          RandomGeneratorType& random_generator);
  };
}

#endif // ISING_INITIALIZER_INIT_DISPATCHER_H
