#ifndef ISING_MONITORS_MAGNETISATION_H
#define ISING_MONITORS_MAGNETISATION_H

#include <libconfig.h++>

#include "ising/core/monitor.h"
#include "ising/helpers/output.h"

namespace ising {

class Solver;

// Writes <name>_mag.tsv with the magnetisation per site and its absolute value.
class MagnetisationMonitor : public Monitor {
public:
    explicit MagnetisationMonitor(const libconfig::Setting &settings);

    ~MagnetisationMonitor() override = default;

    void update(const Solver& solver) override;
    void post_process() override;

private:
    output::TsvWriter tsv_;

    double abs_magnetisation_sum_ = 0.0;
    long   num_samples_ = 0;
};

} // namespace ising

#endif  // ISING_MONITORS_MAGNETISATION_H
