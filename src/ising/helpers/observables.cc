#include "ising/helpers/observables.h"

#include "ising/helpers/montecarlo.h"

namespace ising {

long total_magnetisation(const Lattice& lattice) {
  long total = 0;
  for (auto n = 0; n < lattice.rows(); ++n) {
    for (auto m = 0; m < lattice.cols(); ++m) {
      total += lattice.value(n, m);
    }
  }
  return total;
}

long total_energy(const Lattice& lattice) {
  // every bond is counted twice so the sum is always even
  long bond_sum = 0;
  for (auto n = 0; n < lattice.rows(); ++n) {
    for (auto m = 0; m < lattice.cols(); ++m) {
      bond_sum += lattice.value(n, m) * montecarlo::neighbour_sum(lattice, n, m);
    }
  }
  return -bond_sum / 2;
}

} // namespace ising
