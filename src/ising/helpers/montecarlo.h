#ifndef ISING_HELPERS_MONTECARLO_H
#define ISING_HELPERS_MONTECARLO_H

#include <array>
#include <cmath>
#include <random>

#include "ising/core/lattice.h"
#include "ising/core/types.h"

namespace ising {
    namespace montecarlo {

        /// Largest possible energy difference for a single spin flip. Eight
        /// neighbours each contribute at most 1 to the neighbour sum, so
        /// |dE| = |2 s sum| <= 16.
        constexpr int kMaxEnergyDifference = 16;

        /// Sum of the eight spins surrounding (n, m), i.e. all offsets in
        /// {-1,0,+1} x {-1,0,+1} except the centre, with rows wrapped modulo
        /// N and columns wrapped modulo M.
        ///
        /// @details For a lattice with a dimension of 1 or 2 the wrapped
        /// offsets alias onto the same row/column (or onto the site itself),
        /// in which case those spins are counted more than once. This is the
        /// same result as applying the modulo to every offset.
        inline int neighbour_sum(const Lattice& lattice, const int n, const int m) {
          const int rows = lattice.rows();
          const int cols = lattice.cols();

          const int up    = (n == 0) ? rows - 1 : n - 1;
          const int down  = (n + 1 == rows) ? 0 : n + 1;
          const int left  = (m == 0) ? cols - 1 : m - 1;
          const int right = (m + 1 == cols) ? 0 : m + 1;

          return lattice.value(up, left)   + lattice.value(up, m)   + lattice.value(up, right)
               + lattice.value(n, left)                             + lattice.value(n, right)
               + lattice.value(down, left) + lattice.value(down, m) + lattice.value(down, right);
        }

        /// Energy change (in units of the coupling) for flipping the spin at
        /// (n, m): dE = 2 s(n,m) sum_neighbours. Always an even integer in
        /// [-16, 16].
        inline int energy_difference(const Lattice& lattice, const int n, const int m) {
          return 2 * lattice.value(n, m) * neighbour_sum(lattice, n, m);
        }

        /// Acceptance probabilities exp(-dE beta) for every positive energy
        /// difference a flip can produce. Lives on the stack so it can be
        /// rebuilt at the start of every sweep without allocating.
        ///
        /// The values are computed with exactly the same expression as a
        /// direct std::exp per site so using the table does not change the
        /// outcome of any comparison.
        class BoltzmannTable {
        public:
            explicit BoltzmannTable(const Real beta) : beta_(beta) {
              for (auto k = 0; k < static_cast<int>(probability_.size()); ++k) {
                probability_[k] = boltzmann_factor(2 * k, beta);
              }
            }

            inline Real beta() const { return beta_; }

            /// only valid for even 0 <= dE <= kMaxEnergyDifference
            inline Real operator()(const int dE) const {
              return probability_[dE >> 1];
            }

            inline static Real boltzmann_factor(const int dE, const Real beta) {
              return std::exp(-static_cast<Real>(dE) * beta);
            }

        private:
            Real beta_;
            std::array<Real, kMaxEnergyDifference / 2 + 1> probability_{};
        };

        /// Metropolis criterion for an uphill move. Consumes exactly one
        /// uniform [0,1) sample from `gen`.
        template <class RNG>
        inline bool accept_on_boltzmann_distribution(const Real probability, RNG& gen) {
          std::uniform_real_distribution<Real> uniform_distribution(0.0, 1.0);
          return probability > uniform_distribution(gen);
        }

        /// Evaluate the site (n, m) and flip it in place if the Metropolis
        /// criterion accepts. Returns true if the spin was flipped.
        ///
        /// A random number is drawn only when dE > 0. Moves with dE <= 0 are
        /// always accepted and do not touch the generator, so the position in
        /// the random stream depends on the lattice history. Runs are only
        /// reproducible if this policy is kept.
        template <class RNG>
        inline bool metropolis_site_update(Lattice& lattice, const int n, const int m,
                                           const BoltzmannTable& boltzmann, RNG& gen) {
          const int dE = energy_difference(lattice, n, m);

          if (dE <= 0 || accept_on_boltzmann_distribution(boltzmann(dE), gen)) {
            lattice.flip(n, m);
            return true;
          }
          return false;
        }

        /// Single site form which evaluates the Boltzmann factor directly
        /// rather than through a precomputed table.
        template <class RNG>
        inline bool metropolis_site_update(Lattice& lattice, const int n, const int m,
                                           const Real beta, RNG& gen) {
          const int dE = energy_difference(lattice, n, m);

          if (dE <= 0 || accept_on_boltzmann_distribution(BoltzmannTable::boltzmann_factor(dE, beta), gen)) {
            lattice.flip(n, m);
            return true;
          }
          return false;
        }
    }
}

#endif  // ISING_HELPERS_MONTECARLO_H
