#include "ising/initializer/init_uniform.h"

#include <iostream>

#include "ising/interface/config.h"

void ising::InitUniform::execute(const libconfig::Setting &settings, Lattice& lattice,
                                 RandomGeneratorType&) {
  const Spin spin = config_required<Spin>(settings, "spin");

  std::cout << "  uniform initializer\n";
  std::cout << "    spin " << to_string(spin) << "\n";

  lattice.fill(spin);
}
