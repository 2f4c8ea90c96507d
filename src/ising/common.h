#ifndef ISING_COMMON_H
#define ISING_COMMON_H

#include <string>

#include "ising/interface/system.h"

namespace ising {
    class Ising;
    Ising& instance();

    // Process wide settings which are needed by output code in many places.
    // Simulation state (lattice, random generator, solver) is not kept here.
    class Ising {
    public:
        Ising() = default;
        ~Ising() = default;

        // disable copy and assign
        Ising(const Ising&) = delete;
        void operator=(const Ising&) = delete;

        inline static const std::string& output_path() { return instance().output_path_; }
        static void set_output_dir(const std::string& path) {
          instance().output_path_ = path;
          ising::system::make_path(path);
        }

        inline static const std::string& simulation_name() { return instance().simulation_name_; }
        static void set_simulation_name(const std::string& name) {
          instance().simulation_name_ = name;
        }

    private:
        std::string output_path_ = ".";
        std::string simulation_name_ = "ising";
    };
}

#endif //ISING_COMMON_H
