// types.h                                                             -*-C++-*-

#ifndef ISING_CORE_TYPES_H
#define ISING_CORE_TYPES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ising {

//-----------------------------------------------------------------------------
// numeric policy
//-----------------------------------------------------------------------------

// All floating point work (beta, energy differences, acceptance probabilities
// and uniform random draws) is done at this precision.
using Real = double;

// Inverse temperature used when the caller does not choose one.
constexpr Real kDefaultBeta = 0.4;

//-----------------------------------------------------------------------------
// enums
//-----------------------------------------------------------------------------

// Only two values are representable so no code path can write anything else
// into the lattice.
enum class Spin : std::int8_t {down = -1, up = +1};

inline constexpr int to_int(const Spin s) noexcept {
  return static_cast<int>(s);
}

inline constexpr Spin flipped(const Spin s) noexcept {
  return s == Spin::up ? Spin::down : Spin::up;
}

inline Spin spin_from_int(const int value) {
  if (value == +1) return Spin::up;
  if (value == -1) return Spin::down;
  throw std::invalid_argument("spin value must be +1 or -1, got " + std::to_string(value));
}

inline std::string to_string(const Spin s) {
  return s == Spin::up ? "+1" : "-1";
}

} // namespace ising

#endif // ISING_CORE_TYPES_H
