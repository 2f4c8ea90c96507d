// lattice.h                                                           -*-C++-*-

#ifndef ISING_CORE_LATTICE_H
#define ISING_CORE_LATTICE_H

///
/// @purpose
///     Storage for a two dimensional square lattice of Ising spins with
///     periodic boundaries in both directions.
///
/// @classes
///   Lattice: N x M grid of Spin values stored row major
///
/// @description
///     The dimensions are fixed at construction. Sites are addressed by
///     (n, m) with 0 <= n < rows() and 0 <= m < cols(). Coordinates outside
///     this range can be mapped back with wrap_row() and wrap_col(), which is
///     what gives the lattice the topology of a torus.
///
///     The lattice is owned by the caller. Monte Carlo kernels take it by
///     non-const reference for the duration of a step and never copy it, so
///     any snapshot must be an explicit copy made by the caller.
///

#include <iosfwd>
#include <vector>

#include "ising/core/types.h"

namespace ising {

class Lattice {
public:
    // throws SanityException unless 1 <= rows, 1 <= cols and rows * cols
    // fits in an int
    Lattice(int rows, int cols, Spin initial = Spin::up);

    inline int rows() const { return rows_; }
    inline int cols() const { return cols_; }
    inline int size() const { return rows_ * cols_; }

    inline Spin& operator()(int n, int m);
    inline const Spin& operator()(int n, int m) const;

    // spin at (n, m) as an integer (-1 or +1)
    inline int value(int n, int m) const;

    inline void flip(int n, int m);

    // map any integer coordinate into [0, rows) or [0, cols)
    inline int wrap_row(int n) const;
    inline int wrap_col(int m) const;

    // checkerboard class of a site: 2 * (n % 2) + (m % 2)
    inline static int parity_class(int n, int m);

    void fill(Spin s);

    inline const Spin* data() const { return spins_.data(); }

    bool operator==(const Lattice& rhs) const;
    bool operator!=(const Lattice& rhs) const { return !(*this == rhs); }

private:
    inline int index(int n, int m) const { return n * cols_ + m; }

    int rows_;
    int cols_;
    std::vector<Spin> spins_;
};

std::ostream& operator<<(std::ostream& os, const Lattice& lattice);

inline Spin& Lattice::operator()(const int n, const int m) {
  return spins_[index(n, m)];
}

inline const Spin& Lattice::operator()(const int n, const int m) const {
  return spins_[index(n, m)];
}

inline int Lattice::value(const int n, const int m) const {
  return to_int(spins_[index(n, m)]);
}

inline void Lattice::flip(const int n, const int m) {
  auto& s = spins_[index(n, m)];
  s = flipped(s);
}

inline int Lattice::wrap_row(const int n) const {
  const int r = n % rows_;
  return r < 0 ? r + rows_ : r;
}

inline int Lattice::wrap_col(const int m) const {
  const int r = m % cols_;
  return r < 0 ? r + cols_ : r;
}

inline int Lattice::parity_class(const int n, const int m) {
  return 2 * (n & 1) + (m & 1);
}

} // namespace ising

#endif  // ISING_CORE_LATTICE_H
