#include "ising/monitors/energy.h"

#include <iostream>

#include "ising/core/solver.h"
#include "ising/helpers/observables.h"

namespace ising {

EnergyMonitor::EnergyMonitor(const libconfig::Setting &settings)
: Monitor(settings),
  tsv_(output::full_path_filename("eng.tsv"),
       {{"step", "steps", output::ColFmt::Integer},
        {"e", "J", output::ColFmt::Fixed}},
       output_precision_)
{}

void EnergyMonitor::update(const Solver& solver) {
  const double e = energy_per_site(solver.lattice());

  tsv_.write_row({double(solver.iteration()), e});

  if (verbose_is_enabled()) {
    std::cout << "energy " << solver.iteration() << " " << e << "\n";
  }
}

} // namespace ising
