// init_dispatcher.cc                                                  -*-C++-*-
#include "ising/initializer/init_dispatcher.h"
#include "ising/initializer/init_random.h"
#include "ising/initializer/init_uniform.h"

#include <string>

#include "ising/helpers/utils.h"
#include "ising/interface/config.h"

#define DEFINED_INITIALIZER(module, type, settings) \
{ \
  if (lowercase(settings["module"]) == module) { \
    type::execute(settings, lattice, random_generator); \
    return; \
  } \
}

void ising::InitializerDispatcher::execute(const libconfig::Setting &settings, Lattice& lattice,
                                           RandomGeneratorType& random_generator) {
  DEFINED_INITIALIZER("random", InitRandom, settings);
  DEFINED_INITIALIZER("uniform", InitUniform, settings);

  throw ConfigException(settings, "unknown initializer ", std::string(settings["module"].c_str()));
}

#undef DEFINED_INITIALIZER
