#include "ising/solvers/cpu_monte_carlo_checkerboard.h"

#include <iostream>

#include "ising/helpers/defaults.h"
#include "ising/helpers/utils.h"
#include "ising/interface/config.h"
#include "ising/solvers/checkerboard_sweep.h"

using namespace std;

namespace ising {

Real CheckerboardMetropolisSolver::read_beta(const libconfig::Setting &settings) {
  if (settings.exists("beta") && settings.exists("temperature")) {
    throw ConfigException(settings, "only one of 'beta' or 'temperature' may be given");
  }

  if (settings.exists("temperature")) {
    return 1.0 / config_required_positive<double>(settings, "temperature");
  }

  if (settings.exists("beta")) {
    return config_required_positive<double>(settings, "beta");
  }

  return defaults::solver_beta;
}

void CheckerboardMetropolisSolver::initialize(const libconfig::Setting& settings) {
  max_steps_ = config_required<int>(settings, "max_steps");
  if (max_steps_ < 0) {
    throw ConfigException(settings["max_steps"], "must not be negative");
  }

  beta_ = read_beta(settings);

  output_write_steps_ = config_optional<int>(settings, "output_write_steps", defaults::solver_output_write_steps);
  if (output_write_steps_ < 1) {
    throw ConfigException(settings["output_write_steps"], "must be at least 1");
  }

  cout << "    max_steps " << max_steps_ << "\n";
  cout << "    beta " << beta_ << "\n";
  cout << "    temperature " << 1.0 / beta_ << "\n";
  cout << "    output_write_steps " << output_write_steps_ << "\n";

  stats_file_.reset(new output::TsvWriter(
      output::full_path_filename("monte_carlo_stats.tsv"),
      {{"iteration", "steps", output::ColFmt::Integer},
       {"acceptance", "dimensionless", output::ColFmt::Fixed}},
      6));
}

void CheckerboardMetropolisSolver::run() {
  const long flips = checkerboard_sweep(lattice_, beta_, random_generator_);

  moves_attempted_ += lattice_.size();
  moves_accepted_ += flips;

  move_total_count_ += lattice_.size();
  move_total_acceptance_count_ += flips;

  iteration_++;

  // Output statistics to file at the configured interval
  if (iteration_ % output_write_steps_ == 0) {
    output_move_statistics();

    // Reset statistics
    moves_attempted_ = 0;
    moves_accepted_ = 0;
  }
}

double CheckerboardMetropolisSolver::total_acceptance_ratio() const {
  return division_or_zero(move_total_acceptance_count_, move_total_count_);
}

void CheckerboardMetropolisSolver::output_move_statistics() {
  if (stats_file_) {
    stats_file_->write_row({double(iteration_), division_or_zero(moves_accepted_, moves_attempted_)});
  }
}

} // namespace ising
