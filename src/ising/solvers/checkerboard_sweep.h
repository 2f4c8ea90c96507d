// checkerboard_sweep.h                                                -*-C++-*-

#ifndef ISING_SOLVERS_CHECKERBOARD_SWEEP_H
#define ISING_SOLVERS_CHECKERBOARD_SWEEP_H

///
/// @purpose
///     Checkerboard scheduling of single spin Metropolis updates.
///
/// @description
///     The lattice is split into four sublattices by the parity of the row
///     and column index. With an eight site neighbourhood no two sites of the
///     same (row parity, column parity) class are neighbours, so within one
///     class every site sees the same, fixed, environment. One step visits
///     the classes in the order
///
///         (0,0)  (0,1)  (1,0)  (1,1)
///
///     and within a class sites are visited row major. Each class observes
///     all flips made by the classes before it. The order of the classes is
///     part of the definition of the Markov chain: changing it changes the
///     result of a seeded run.
///
///     None of these functions allocate and none validate beta.
///

#include <array>
#include <utility>

#include "ising/core/lattice.h"
#include "ising/core/types.h"
#include "ising/helpers/montecarlo.h"

namespace ising {

// (row parity, column parity) in sweep order
constexpr std::array<std::pair<int, int>, 4> kCheckerboardClasses = {{
    {0, 0}, {0, 1}, {1, 0}, {1, 1}
}};

/// Metropolis update of every site with n % 2 == row_parity and
/// m % 2 == col_parity. Returns the number of flipped spins.
template <class RNG>
long sweep_sublattice(Lattice& lattice, const int row_parity, const int col_parity,
                      const montecarlo::BoltzmannTable& boltzmann, RNG& gen) {
  long flips = 0;
  for (auto n = row_parity; n < lattice.rows(); n += 2) {
    for (auto m = col_parity; m < lattice.cols(); m += 2) {
      flips += montecarlo::metropolis_site_update(lattice, n, m, boltzmann, gen);
    }
  }
  return flips;
}

/// One full checkerboard sweep; every site is visited exactly once. Returns
/// the number of flipped spins.
template <class RNG>
long checkerboard_sweep(Lattice& lattice, const Real beta, RNG& gen) {
  const montecarlo::BoltzmannTable boltzmann(beta);

  long flips = 0;
  for (const auto& parity : kCheckerboardClasses) {
    flips += sweep_sublattice(lattice, parity.first, parity.second, boltzmann, gen);
  }
  return flips;
}

/// Advance the lattice by one step at inverse temperature beta. The lattice
/// is updated in place and returned.
template <class RNG>
Lattice& step(Lattice& lattice, const Real beta, RNG& gen) {
  checkerboard_sweep(lattice, beta, gen);
  return lattice;
}

template <class RNG>
Lattice& step(Lattice& lattice, RNG& gen) {
  return step(lattice, kDefaultBeta, gen);
}

/// `num_steps` consecutive steps. Zero steps leaves the lattice untouched.
template <class RNG>
Lattice& run(Lattice& lattice, const int num_steps, const Real beta, RNG& gen) {
  for (auto i = 0; i < num_steps; ++i) {
    step(lattice, beta, gen);
  }
  return lattice;
}

} // namespace ising

#endif // ISING_SOLVERS_CHECKERBOARD_SWEEP_H
