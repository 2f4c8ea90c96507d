#ifndef ISING_INITIALIZER_INIT_UNIFORM_H
#define ISING_INITIALIZER_INIT_UNIFORM_H

#include <libconfig.h++>

#include "ising/core/lattice.h"
#include "ising/helpers/random.h"

namespace ising {
///
/// Sets every spin to `spin` (+1 or -1).
///
/// initializer : {
///   module = "uniform";
///   spin = -1;
/// };
///
class InitUniform {
public:
    static void execute(const libconfig::Setting &settings, Lattice& lattice,
                        RandomGeneratorType& random_generator);
};
}

#endif // ISING_INITIALIZER_INIT_UNIFORM_H
