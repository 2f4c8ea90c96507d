#include "ising/core/lattice.h"

#include <algorithm>
#include <limits>
#include <ostream>

#include "ising/helpers/exception.h"

namespace ising {

Lattice::Lattice(const int rows, const int cols, const Spin initial)
: rows_(rows),
  cols_(cols) {
  if (rows_ < 1 || cols_ < 1) {
    throw SanityException("lattice dimensions must be positive, got ", rows_, " x ", cols_);
  }
  // sites are indexed with int
  if (static_cast<long long>(rows_) * cols_ > std::numeric_limits<int>::max()) {
    throw SanityException("lattice of ", rows_, " x ", cols_, " sites is too large");
  }
  spins_.assign(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_), initial);
}

void Lattice::fill(const Spin s) {
  std::fill(spins_.begin(), spins_.end(), s);
}

bool Lattice::operator==(const Lattice &rhs) const {
  return rows_ == rhs.rows_ && cols_ == rhs.cols_ && spins_ == rhs.spins_;
}

std::ostream& operator<<(std::ostream& os, const Lattice& lattice) {
  for (auto n = 0; n < lattice.rows(); ++n) {
    for (auto m = 0; m < lattice.cols(); ++m) {
      os << (lattice(n, m) == Spin::up ? '+' : '-');
    }
    os << '\n';
  }
  return os;
}

} // namespace ising
