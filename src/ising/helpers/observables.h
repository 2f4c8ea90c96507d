#ifndef ISING_HELPERS_OBSERVABLES_H
#define ISING_HELPERS_OBSERVABLES_H

#include "ising/core/lattice.h"

namespace ising {

/// Sum of all spins.
long total_magnetisation(const Lattice& lattice);

/// Energy in units of the coupling,
///
///     E = -1/2 sum_i s_i sum_{j in nbrs(i)} s_j
///
/// over the same eight site periodic neighbourhood used by the Metropolis
/// update, so flipping a single spin changes E by exactly
/// montecarlo::energy_difference().
long total_energy(const Lattice& lattice);

inline double magnetisation_per_site(const Lattice& lattice) {
  return static_cast<double>(total_magnetisation(lattice)) / lattice.size();
}

inline double energy_per_site(const Lattice& lattice) {
  return static_cast<double>(total_energy(lattice)) / lattice.size();
}

} // namespace ising

#endif  // ISING_HELPERS_OBSERVABLES_H
