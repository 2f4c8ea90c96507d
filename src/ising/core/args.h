#ifndef ISING_CORE_ARGS_H
#define ISING_CORE_ARGS_H

#include <string>
#include <vector>

namespace ising {

    struct ProgramArgs {
        bool        version_only    = false;
        bool        setup_only      = false;
        std::string output_path     = "";
        std::string simulation_name = "";

        // a vector of filenames or patch strings to assemble to config
        std::vector<std::string> config_strings;
    };

    ProgramArgs parse_args(int argc, char **argv);
}

#endif //ISING_CORE_ARGS_H
