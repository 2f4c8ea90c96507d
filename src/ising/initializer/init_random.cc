#include "ising/initializer/init_random.h"

#include <iostream>
#include <random>

#include "ising/interface/config.h"

void ising::InitRandom::execute(const libconfig::Setting &settings, Lattice& lattice,
                                RandomGeneratorType& random_generator) {
  const double fraction_up = config_optional<double>(settings, "fraction_up", 0.5);
  if (fraction_up < 0.0 || fraction_up > 1.0) {
    throw ConfigException(settings["fraction_up"], "must be in the range [0, 1]");
  }

  std::cout << "  random initializer\n";
  std::cout << "    fraction_up " << fraction_up << "\n";

  std::bernoulli_distribution is_up(fraction_up);
  for (auto n = 0; n < lattice.rows(); ++n) {
    for (auto m = 0; m < lattice.cols(); ++m) {
      lattice(n, m) = is_up(random_generator) ? Spin::up : Spin::down;
    }
  }
}
