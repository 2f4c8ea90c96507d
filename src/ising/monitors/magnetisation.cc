#include "ising/monitors/magnetisation.h"

#include <cmath>
#include <iostream>

#include "ising/core/solver.h"
#include "ising/helpers/observables.h"
#include "ising/helpers/utils.h"

namespace ising {

MagnetisationMonitor::MagnetisationMonitor(const libconfig::Setting &settings)
: Monitor(settings),
  tsv_(output::full_path_filename("mag.tsv"),
       {{"step", "steps", output::ColFmt::Integer},
        {"m", "dimensionless", output::ColFmt::Fixed},
        {"m_abs", "dimensionless", output::ColFmt::Fixed}},
       output_precision_)
{}

void MagnetisationMonitor::update(const Solver& solver) {
  const double m = magnetisation_per_site(solver.lattice());

  abs_magnetisation_sum_ += std::abs(m);
  num_samples_++;

  tsv_.write_row({double(solver.iteration()), m, std::abs(m)});

  if (verbose_is_enabled()) {
    std::cout << "magnetisation " << solver.iteration() << " " << m << "\n";
  }
}

void MagnetisationMonitor::post_process() {
  std::cout << "    mean |m| " << division_or_zero(abs_magnetisation_sum_, num_samples_) << "\n";
}

} // namespace ising
