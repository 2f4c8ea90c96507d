#include "ising/common.h"

namespace ising {
    Ising &instance() {
      static Ising ising_instance;
      return ising_instance;
    }
}
