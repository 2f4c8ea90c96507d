#ifndef ISING_CORE_BASE_H
#define ISING_CORE_BASE_H

#include <string>

namespace libconfig { class Setting; }

namespace ising {

// Common settings of config-created modules: the module name and whether the
// module echoes what it records to stdout.
class Base {
public:
    explicit Base(const libconfig::Setting& settings);

    inline const std::string& name() const { return name_; }

    inline bool verbose_is_enabled() const { return verbose_; }

private:
    std::string name_;
    bool verbose_ = false;
};

} // namespace ising

#endif //ISING_CORE_BASE_H
