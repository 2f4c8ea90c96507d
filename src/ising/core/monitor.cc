#include <iostream>
#include <string>

#include "ising/core/monitor.h"
#include "ising/helpers/defaults.h"
#include "ising/helpers/utils.h"
#include "ising/interface/config.h"
#include "ising/monitors/energy.h"
#include "ising/monitors/magnetisation.h"

using namespace std;
using namespace libconfig;
using ising::config_optional;

#define DEFINED_MONITOR(name, type, settings) \
{ \
  if (lowercase(settings["module"]) == name) { \
    return new type(settings); \
  } \
}

namespace ising {

Monitor::Monitor(const Setting &settings)
: Base(settings),
  output_step_freq_(
          config_optional<int>(settings, "output_steps", ising::defaults::monitor_output_steps)),
  output_precision_(
          config_optional<int>(settings, "precision", ising::defaults::monitor_output_precision))
{
  if (output_step_freq_ < 1) {
    throw ConfigException(settings["output_steps"], "must be at least 1");
  }

  cout << "  " << name() << " monitor\n";
  cout << "    output_steps " << output_step_freq_ << "\n";
  cout << "    verbose " << verbose_is_enabled() << "\n";
}

bool Monitor::is_updating(const int &iteration) const {
  if (iteration % output_step_freq_ == 0) {
    return true;
  }
  return false;
}

Monitor* Monitor::create(const Setting &settings) {
  DEFINED_MONITOR("energy", EnergyMonitor, settings);
  DEFINED_MONITOR("magnetisation", MagnetisationMonitor, settings);

  throw ConfigException(settings, "unknown monitor ", std::string(settings["module"].c_str()));
}

} // namespace ising

#undef DEFINED_MONITOR
