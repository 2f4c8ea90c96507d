#ifndef ISING_HELPERS_DEFAULTS_H
#define ISING_HELPERS_DEFAULTS_H

#include <sys/types.h>
#include <libconfig.h++>

#include "ising/core/types.h"

namespace ising {
    namespace defaults {
        constexpr bool   sim_verbose_output = false;

        constexpr int    config_float_precision = 8;
        constexpr int    config_options = libconfig::Config::OptionAutoConvert;

        constexpr auto   initializer_module = "random";

        constexpr int    monitor_output_steps = 100;
        constexpr int    monitor_output_precision = 8;

        constexpr Real   solver_beta = kDefaultBeta;
        constexpr int    solver_output_write_steps = 1000;

        constexpr mode_t make_path_mode = 0755;

    } // namespace defaults
} // namespace ising

#endif //ISING_HELPERS_DEFAULTS_H
