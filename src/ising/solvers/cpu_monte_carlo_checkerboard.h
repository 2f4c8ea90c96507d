#ifndef ISING_SOLVERS_CPU_MONTE_CARLO_CHECKERBOARD_H
#define ISING_SOLVERS_CPU_MONTE_CARLO_CHECKERBOARD_H

#include <memory>
#include <string>

#include "ising/core/solver.h"
#include "ising/core/types.h"
#include "ising/helpers/output.h"

namespace ising {

// Single spin flip Metropolis dynamics with a four colour checkerboard sweep.
// One call to run() is one full lattice sweep.
class CheckerboardMetropolisSolver : public Solver {
 public:
  using Solver::Solver;
  ~CheckerboardMetropolisSolver() override = default;

  void initialize(const libconfig::Setting& settings) override;
  void run() override;

  std::string name() const override { return "monte-carlo-checkerboard-cpu"; }

  inline Real beta() const { return beta_; }

  // accepted flips / attempted flips over the whole run
  double total_acceptance_ratio() const;

 private:
  static Real read_beta(const libconfig::Setting& settings);

  void output_move_statistics();

  Real beta_ = kDefaultBeta;
  int output_write_steps_ = 1000;

  unsigned long long moves_attempted_ = 0;
  unsigned long long moves_accepted_ = 0;

  unsigned long long move_total_count_ = 0;
  unsigned long long move_total_acceptance_count_ = 0;

  std::unique_ptr<output::TsvWriter> stats_file_;
};

} // namespace ising

#endif  // ISING_SOLVERS_CPU_MONTE_CARLO_CHECKERBOARD_H
