#include "ising/core/base.h"
#include "ising/interface/config.h"

namespace ising {

Base::Base(const libconfig::Setting &settings)
: name_(ising::config_optional<std::string>(settings, "module", "")),
  verbose_(ising::config_optional<bool>(settings, "verbose", false)) {}

} // namespace ising
