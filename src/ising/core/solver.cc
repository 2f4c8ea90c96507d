#include <iostream>
#include <string>

#include "ising/core/solver.h"
#include "ising/helpers/utils.h"
#include "ising/interface/config.h"
#include "ising/solvers/cpu_monte_carlo_checkerboard.h"

#define DEFINED_SOLVER(name, type) \
{ \
if (lowercase(settings["module"]) == name) { \
std::cout << name << " solver \n"; \
return new type(lattice, random_generator); \
} \
}

using namespace std;

namespace ising {

Solver* Solver::create(const libconfig::Setting &settings, Lattice& lattice,
                       RandomGeneratorType& random_generator) {
  DEFINED_SOLVER("monte-carlo-checkerboard-cpu", CheckerboardMetropolisSolver);

  throw ConfigException(settings, "unknown solver ", std::string(settings["module"].c_str()));
}

void Solver::register_monitor(Monitor* monitor) {
  monitors_.push_back(static_cast<unique_ptr<Monitor>>(monitor));
}

void Solver::notify_monitors() {
  for (auto& m : monitors_) {
    if (m->is_updating(iteration_)) {
      m->update(*this);
    }
  }
}

bool Solver::is_running() const {
  return iteration_ < max_steps_;
}

} // namespace ising

#undef DEFINED_SOLVER
