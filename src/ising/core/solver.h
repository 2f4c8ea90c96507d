#ifndef ISING_CORE_SOLVER_H
#define ISING_CORE_SOLVER_H

#include <memory>
#include <string>
#include <vector>
#include <libconfig.h++>

#include "ising/core/lattice.h"
#include "ising/core/monitor.h"
#include "ising/helpers/random.h"

namespace ising {

// A solver advances the lattice one step per call to run(). It borrows the
// lattice and the random generator from the simulation which owns them.
class Solver {
 public:
  Solver(Lattice& lattice, RandomGeneratorType& random_generator)
  : lattice_(lattice), random_generator_(random_generator) {}

  virtual ~Solver() = default;

  virtual void initialize(const libconfig::Setting& settings) = 0;
  virtual void run() = 0;

  virtual std::string name() const = 0;

  virtual bool is_running() const;

  inline int iteration() const {
    return iteration_;
  }

  inline int max_steps() const {
    return max_steps_;
  }

  inline const Lattice& lattice() const {
    return lattice_;
  }

  void register_monitor(Monitor* monitor);

  virtual void notify_monitors();

  const std::vector<std::unique_ptr<Monitor>>& monitors() const {
    return monitors_;
  }

  static Solver* create(const libconfig::Setting &settings, Lattice& lattice,
                        RandomGeneratorType& random_generator);
 protected:
  int iteration_ = 0;
  int max_steps_ = 0;

  Lattice& lattice_;
  RandomGeneratorType& random_generator_;

  std::vector<std::unique_ptr<Monitor>> monitors_;
};

} // namespace ising

#endif  // ISING_CORE_SOLVER_H
