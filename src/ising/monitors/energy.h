#ifndef ISING_MONITORS_ENERGY_H
#define ISING_MONITORS_ENERGY_H

#include <libconfig.h++>

#include "ising/core/monitor.h"
#include "ising/helpers/output.h"

namespace ising {

class Solver;

class EnergyMonitor : public Monitor {
public:
    explicit EnergyMonitor(const libconfig::Setting &settings);

    ~EnergyMonitor() override = default;

    void update(const Solver& solver) override;
    void post_process() override {};

private:
    output::TsvWriter tsv_;
};

} // namespace ising

#endif  // ISING_MONITORS_ENERGY_H
