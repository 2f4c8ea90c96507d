#ifndef ISING_HELPERS_PROGRESS_BAR_H
#define ISING_HELPERS_PROGRESS_BAR_H

#include <iomanip>
#include <ostream>

#include "ising/interface/system.h"

// Fraction of a run completed, drawn as a bar on a terminal or as a line of
// percentages every 10% otherwise.
class ProgressBar {
public:
    inline void set(const float &x) {
      progress_ = x;
    }

    inline float progress() const {
      return progress_;
    }

    inline float percent() const {
      return progress_ * 100.0f;
    }

    inline unsigned width() const {
      return width_;
    }

    // when not writing to a terminal only print every 10%
    inline bool do_next_static_output() {
      if (static_cast<unsigned>(percent()) >= static_next_) {
        static_next_ += static_resolution_;
        return true;
      }
      return false;
    };

private:
    unsigned width_    = 72;
    float    progress_ = 0.0;
    unsigned static_resolution_ = 10; // percent
    unsigned static_next_ = 10; // percent
};

inline std::ostream& operator<<(std::ostream& os, ProgressBar &p) {
  if (ising::system::stdout_is_tty()) {
    auto pos = static_cast<unsigned>(p.width() * p.progress());
    os << "\r[";
    for (unsigned i = 0; i < p.width(); ++i) {
      os << ((i <= pos) ? "=" : " ");
    }
    os << "] ";
    os << std::setw(3) << static_cast<unsigned>(p.percent()) << " %" << std::flush;
  } else {
    if (p.do_next_static_output()) {
      os << "..." << static_cast<unsigned>(p.percent()) << "%" << std::flush;
    }
  }
  return os;
}

#endif //ISING_HELPERS_PROGRESS_BAR_H
