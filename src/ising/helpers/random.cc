#include "ising/helpers/random.h"

#include <random>
#include <sstream>

#include "ising/helpers/exception.h"
#include "ising/helpers/utils.h"

namespace ising {

RandomGeneratorType make_random_generator() {
  std::random_device rd;
  return RandomGeneratorType(concatenate_32_bit(rd(), rd()));
}

RandomGeneratorType make_random_generator(const std::uint64_t seed) {
  return RandomGeneratorType(seed);
}

std::string random_generator_state(const RandomGeneratorType& gen) {
  std::stringstream ss;
  ss << gen;
  return ss.str();
}

void set_random_generator_state(RandomGeneratorType& gen, const std::string& state) {
  std::istringstream is(state);
  RandomGeneratorType restored;
  is >> restored;
  if (is.fail()) {
    throw GeneralException("invalid random generator state '", state, "'");
  }
  gen = restored;
}

} // namespace ising
