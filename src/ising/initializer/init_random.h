#ifndef ISING_INITIALIZER_INIT_RANDOM_H
#define ISING_INITIALIZER_INIT_RANDOM_H

#include <libconfig.h++>

#include "ising/core/lattice.h"
#include "ising/helpers/random.h"

namespace ising {
///
/// Initialises every spin independently, up with probability `fraction_up`
/// (default 0.5). Sites are drawn in row major order from the simulation
/// generator so a seeded run starts from the same configuration.
///
/// initializer : {
///   module = "random";
///   fraction_up = 0.5;
/// };
///
class InitRandom {
public:
    static void execute(const libconfig::Setting &settings, Lattice& lattice,
                        RandomGeneratorType& random_generator);
};
}

#endif // ISING_INITIALIZER_INIT_RANDOM_H
