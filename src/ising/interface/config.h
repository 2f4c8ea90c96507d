#ifndef ISING_INTERFACE_CONFIG_H
#define ISING_INTERFACE_CONFIG_H

#include <string>
#include <libconfig.h++>

#include "ising/core/types.h"
#include "ising/helpers/exception.h"

/// Merge `patch` into `orig`. Scalars and lists in the patch replace those in
/// the original, groups are merged recursively.
void overwrite_config_settings(libconfig::Setting& orig, const libconfig::Setting& patch);

namespace ising {

    /// Returns the value of the setting `name` within the group of settings
    /// `s`. If the setting is not found a libconfig::SettingNotFoundException
    /// is thrown.
    ///
    /// Usually the template parameter type `T` should be specified to ensure
    /// the setting is converted to the correct type in ambigious cases (e.g.
    /// int vs float).
    ///
    /// @example
    /// auto my_param = config_required<double>(some_settings, "value");
    ///
    template<typename T>
    inline T config_required(const libconfig::Setting &s, const std::string &name);

    /// Returns the value of the setting `name` within the group of settings
    /// `s`. If the setting is not found the default value `def` is returned.
    ///
    /// @example
    /// auto my_param = config_optional<double>(some_settings, "value", 1.0);
    ///
    template<typename T>
    inline T config_optional(const libconfig::Setting &setting, const std::string &name, const T& def) {
        if (setting.exists(name)) {
          return config_required<T>(setting, name);
        } else {
          return def;
        }
    }

    template<>
    inline std::string config_required(const libconfig::Setting &setting, const std::string &name) {
      return setting[name].c_str();
    }

    template<>
    inline bool config_required(const libconfig::Setting &setting, const std::string &name) {
      return bool(setting[name]);
    }

    template<>
    inline int config_required(const libconfig::Setting &setting, const std::string &name) {
      return int(setting[name]);
    }

    template<>
    inline long config_required(const libconfig::Setting &setting, const std::string &name) {
      return long(setting[name]);
    }

    template<>
    inline unsigned long config_required(const libconfig::Setting &setting, const std::string &name) {
      return (unsigned long)(setting[name]);
    }

    template<>
    inline double config_required(const libconfig::Setting &setting, const std::string &name) {
      return double(setting[name]);
    }

    template<>
    inline Spin config_required(const libconfig::Setting &setting, const std::string &name) {
      const int value = int(setting[name]);
      if (value != 1 && value != -1) {
        throw ConfigException(setting[name], "spin must be +1 or -1");
      }
      return spin_from_int(value);
    }

    /// As config_required but throws a ConfigException unless value > 0
    template<typename T>
    inline T config_required_positive(const libconfig::Setting &setting, const std::string &name) {
      auto value = config_required<T>(setting, name);
      if (!(value > T(0))) {
        throw ConfigException(setting[name], "must be positive");
      }
      return value;
    }
}

#endif //ISING_INTERFACE_CONFIG_H
