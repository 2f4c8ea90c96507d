#include "ising/interface/config.h"

#include <cstdint>

using namespace libconfig;

namespace {
    void config_copy_setting(Setting& dest, const Setting& src);

    Setting& config_add_like(Setting& parent, const Setting& src) {
      if (parent.isGroup()) {
        return parent.add(src.getName(), src.getType());
      }
      return parent.add(src.getType());
    }

    void config_copy_setting(Setting& dest, const Setting& src) {
      switch (src.getType()) {
        case Setting::TypeInt:
          dest = int(src);
          dest.setFormat(src.getFormat());
          return;
        case Setting::TypeInt64:
          dest = static_cast<long long>(src);
          dest.setFormat(src.getFormat());
          return;
        case Setting::TypeFloat:
          dest = double(src);
          return;
        case Setting::TypeString:
          dest = src.c_str();
          return;
        case Setting::TypeBoolean:
          dest = bool(src);
          return;
        case Setting::TypeGroup:
        case Setting::TypeArray:
        case Setting::TypeList:
          for (auto i = 0; i < src.getLength(); ++i) {
            config_copy_setting(config_add_like(dest, src[i]), src[i]);
          }
          return;
        default:
          throw ising::ConfigException(src, "unknown config setting type");
      }
    }
}

void overwrite_config_settings(Setting& orig, const Setting& patch) {
  for (auto i = 0; i < patch.getLength(); ++i) {
    const Setting& p = patch[i];
    const char* name = p.getName();

    if (p.isGroup() && orig.exists(name) && orig[name].isGroup()) {
      overwrite_config_settings(orig[name], p);
      continue;
    }

    if (orig.exists(name)) {
      orig.remove(name);
    }
    config_copy_setting(orig.add(name, p.getType()), p);
  }
}
