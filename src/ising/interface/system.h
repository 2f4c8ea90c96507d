#ifndef ISING_INTERFACE_SYSTEM_H
#define ISING_INTERFACE_SYSTEM_H

#include <string>
#include "ising/helpers/defaults.h"

namespace ising {
    namespace system {
        // true if a regular file exists at path
        bool file_exists(const std::string &path);

        // creates every missing directory along path, like mkdir -p
        void make_path(const std::string &path, mode_t mode = defaults::make_path_mode);

        bool stdout_is_tty();
    }
}

#endif //ISING_INTERFACE_SYSTEM_H
