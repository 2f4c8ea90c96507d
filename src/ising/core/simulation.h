#ifndef ISING_CORE_SIMULATION_H
#define ISING_CORE_SIMULATION_H

#include <memory>
#include <string>
#include <vector>
#include <libconfig.h++>

#include "ising/core/args.h"
#include "ising/core/lattice.h"
#include "ising/core/solver.h"
#include "ising/helpers/defaults.h"
#include "ising/helpers/random.h"

namespace ising {
    // Everything a run owns. The solver holds references to the lattice and
    // the random generator so it must be destroyed first.
    struct Simulation {
        bool verbose = ising::defaults::sim_verbose_output;

        std::string   random_state;
        unsigned long random_seed = 0;

        std::unique_ptr<libconfig::Config> config;
        std::unique_ptr<Lattice>           lattice;
        RandomGeneratorType                random_generator = make_random_generator();
        std::unique_ptr<Solver>            solver;
    };

    std::string section(const std::string &name);

    // Reads a vector of strings in order, combining to produce a config.
    //
    // If the string is an existent file name it is loaded as a config,
    // otherwise it is directly interpreted as a config string.
    void parse_config_strings(const std::vector<std::string>& config_strings,
                              std::unique_ptr<libconfig::Config>& combined_config);

    std::string choose_simulation_name(const ising::ProgramArgs &program_args);

    void initialize_simulation(const ising::ProgramArgs& program_args);
    void run_simulation();
    void cleanup_simulation();
}

#endif // ISING_CORE_SIMULATION_H
