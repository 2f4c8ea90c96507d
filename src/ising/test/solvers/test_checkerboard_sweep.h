#ifndef ISING_TEST_SOLVERS_CHECKERBOARD_SWEEP_H
#define ISING_TEST_SOLVERS_CHECKERBOARD_SWEEP_H

#include <random>
#include <vector>

#include <gtest/gtest.h>

#include "ising/core/lattice.h"
#include "ising/helpers/montecarlo.h"
#include "ising/helpers/random.h"
#include "ising/solvers/checkerboard_sweep.h"
#include "ising/test/generators.h"

namespace {
    ising::Lattice make_random_lattice(int rows, int cols, unsigned seed) {
      ising::Lattice lattice(rows, cols);
      std::mt19937 gen(seed);
      std::bernoulli_distribution coin(0.5);
      for (auto n = 0; n < rows; ++n) {
        for (auto m = 0; m < cols; ++m) {
          lattice(n, m) = coin(gen) ? ising::Spin::up : ising::Spin::down;
        }
      }
      return lattice;
    }

    bool all_spins_valid(const ising::Lattice& lattice) {
      for (auto n = 0; n < lattice.rows(); ++n) {
        for (auto m = 0; m < lattice.cols(); ++m) {
          const int s = lattice.value(n, m);
          if (s != 1 && s != -1) return false;
        }
      }
      return true;
    }
}

TEST(CheckerboardSweepTest, class_order) {
  using namespace ising;

  ASSERT_EQ(kCheckerboardClasses.size(), 4);
  EXPECT_EQ(kCheckerboardClasses[0], std::make_pair(0, 0));
  EXPECT_EQ(kCheckerboardClasses[1], std::make_pair(0, 1));
  EXPECT_EQ(kCheckerboardClasses[2], std::make_pair(1, 0));
  EXPECT_EQ(kCheckerboardClasses[3], std::make_pair(1, 1));
}

TEST(CheckerboardSweepTest, step_returns_same_lattice) {
  using namespace ising;

  Lattice lattice = make_random_lattice(6, 6, 1);
  auto gen = make_random_generator(42);

  Lattice& result = step(lattice, 0.3, gen);
  EXPECT_EQ(&result, &lattice);

  Lattice& default_beta_result = step(lattice, gen);
  EXPECT_EQ(&default_beta_result, &lattice);
}

TEST(CheckerboardSweepTest, shape_and_values_preserved) {
  using namespace ising;

  Lattice lattice = make_random_lattice(7, 5, 2);
  auto gen = make_random_generator(42);

  run(lattice, 20, 0.25, gen);

  EXPECT_EQ(lattice.rows(), 7);
  EXPECT_EQ(lattice.cols(), 5);
  EXPECT_TRUE(all_spins_valid(lattice));
}

TEST(CheckerboardSweepTest, deterministic_for_equal_generators) {
  using namespace ising;

  const Lattice initial = make_random_lattice(16, 12, 3);

  Lattice a = initial;
  Lattice b = initial;

  auto gen_a = make_random_generator(2024);
  auto gen_b = make_random_generator(2024);

  run(a, 10, 0.4, gen_a);
  run(b, 10, 0.4, gen_b);

  EXPECT_EQ(a, b);
  EXPECT_EQ(gen_a, gen_b);
}

TEST(CheckerboardSweepTest, zero_steps_is_identity) {
  using namespace ising;

  const Lattice initial = make_random_lattice(8, 8, 4);
  Lattice lattice = initial;

  auto gen = make_random_generator(1);
  const auto gen_before = gen;

  run(lattice, 0, 0.4, gen);

  EXPECT_EQ(lattice, initial);
  EXPECT_EQ(gen, gen_before);
}

TEST(CheckerboardSweepTest, sublattice_only_touches_its_class) {
  using namespace ising;

  const Lattice initial = make_random_lattice(9, 10, 5);

  for (const auto& parity : kCheckerboardClasses) {
    Lattice lattice = initial;
    auto gen = make_random_generator(7);

    // beta = 0 accepts every move so every site of the class flips
    const long flips = sweep_sublattice(lattice, parity.first, parity.second,
                                        montecarlo::BoltzmannTable(0.0), gen);

    long class_size = 0;
    for (auto n = 0; n < lattice.rows(); ++n) {
      for (auto m = 0; m < lattice.cols(); ++m) {
        if (n % 2 == parity.first && m % 2 == parity.second) {
          EXPECT_NE(lattice(n, m), initial(n, m));
          ++class_size;
        } else {
          EXPECT_EQ(lattice(n, m), initial(n, m));
        }
      }
    }
    EXPECT_EQ(flips, class_size);
  }
}

TEST(CheckerboardSweepTest, step_equals_ordered_class_sweeps) {
  using namespace ising;

  const Lattice initial = make_random_lattice(10, 10, 6);
  const Real beta = 0.35;

  Lattice expected = initial;
  auto gen_expected = make_random_generator(99);
  const montecarlo::BoltzmannTable table(beta);
  sweep_sublattice(expected, 0, 0, table, gen_expected);
  sweep_sublattice(expected, 0, 1, table, gen_expected);
  sweep_sublattice(expected, 1, 0, table, gen_expected);
  sweep_sublattice(expected, 1, 1, table, gen_expected);

  Lattice actual = initial;
  auto gen_actual = make_random_generator(99);
  step(actual, beta, gen_actual);

  EXPECT_EQ(actual, expected);
  EXPECT_EQ(gen_actual, gen_expected);
}

TEST(CheckerboardSweepTest, step_equals_site_by_site_updates) {
  using namespace ising;

  // reference walk: classes in order, row major within a class, beta
  // evaluated directly rather than through a table
  const Lattice initial = make_random_lattice(11, 6, 8);
  const Real beta = 0.45;

  Lattice expected = initial;
  auto gen_expected = make_random_generator(5);
  for (const auto& parity : kCheckerboardClasses) {
    for (auto n = 0; n < expected.rows(); ++n) {
      for (auto m = 0; m < expected.cols(); ++m) {
        if (n % 2 == parity.first && m % 2 == parity.second) {
          montecarlo::metropolis_site_update(expected, n, m, beta, gen_expected);
        }
      }
    }
  }

  Lattice actual = initial;
  auto gen_actual = make_random_generator(5);
  step(actual, beta, gen_actual);

  EXPECT_EQ(actual, expected);
}

TEST(CheckerboardSweepTest, draws_only_for_uphill_moves) {
  using namespace ising;

  const Lattice initial = make_random_lattice(12, 12, 9);
  const Real beta = 0.4;

  // count uphill visits on a replay of the same sweep
  Lattice replay = initial;
  ising::testing::CountingGenerator replay_gen(11);
  long uphill_visits = 0;
  for (const auto& parity : kCheckerboardClasses) {
    for (auto n = parity.first; n < replay.rows(); n += 2) {
      for (auto m = parity.second; m < replay.cols(); m += 2) {
        if (montecarlo::energy_difference(replay, n, m) > 0) {
          ++uphill_visits;
        }
        montecarlo::metropolis_site_update(replay, n, m, beta, replay_gen);
      }
    }
  }
  ASSERT_GT(uphill_visits, 0);
  ASSERT_LT(uphill_visits, initial.size());

  Lattice lattice = initial;
  ising::testing::CountingGenerator gen(11);
  step(lattice, beta, gen);

  EXPECT_EQ(gen.calls(), uphill_visits);
  EXPECT_EQ(lattice, replay);
}

TEST(CheckerboardSweepTest, odd_dimensions_visit_every_site_once) {
  using namespace ising;

  // beta = 0 flips every visited site exactly once per step
  for (const auto& shape : {std::make_pair(1, 1), std::make_pair(1, 5),
                            std::make_pair(3, 3), std::make_pair(5, 2)}) {
    const Lattice initial = make_random_lattice(shape.first, shape.second, 10);
    Lattice lattice = initial;
    auto gen = make_random_generator(3);

    const long flips = checkerboard_sweep(lattice, 0.0, gen);
    EXPECT_EQ(flips, initial.size());

    for (auto n = 0; n < lattice.rows(); ++n) {
      for (auto m = 0; m < lattice.cols(); ++m) {
        EXPECT_EQ(lattice(n, m), flipped(initial(n, m)));
      }
    }
  }
}

TEST(CheckerboardSweepTest, single_site_lattice) {
  using namespace ising;

  // dE = 16 always, so a 1x1 lattice flips with probability exp(-16 beta)
  Lattice lattice(1, 1);
  ising::testing::CountingGenerator gen(17);

  run(lattice, 50, 0.4, gen);
  EXPECT_EQ(gen.calls(), 50);
  EXPECT_TRUE(all_spins_valid(lattice));
}

TEST(CheckerboardSweepTest, large_lattice_many_steps) {
  using namespace ising;

  Lattice lattice = make_random_lattice(200, 200, 12);
  auto gen = make_random_generator(8);

  run(lattice, 100, kDefaultBeta, gen);

  EXPECT_EQ(lattice.rows(), 200);
  EXPECT_EQ(lattice.cols(), 200);
  EXPECT_TRUE(all_spins_valid(lattice));
}

TEST(CheckerboardSweepTest, ground_state_is_stable_at_low_temperature) {
  using namespace ising;

  // every move from the fully aligned state costs dE = 16
  Lattice lattice(20, 20, Spin::down);
  auto gen = make_random_generator(13);

  run(lattice, 10, 5.0, gen);
  EXPECT_EQ(lattice, Lattice(20, 20, Spin::down));
}

#endif // ISING_TEST_SOLVERS_CHECKERBOARD_SWEEP_H
