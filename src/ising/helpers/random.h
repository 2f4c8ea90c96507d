#ifndef ISING_HELPERS_RANDOM_H
#define ISING_HELPERS_RANDOM_H

#include <cstdint>
#include <string>
#include <pcg_random.hpp>

namespace ising {

using RandomGeneratorType = pcg32;

/// Generator seeded from two words of std::random_device.
RandomGeneratorType make_random_generator();

RandomGeneratorType make_random_generator(std::uint64_t seed);

/// Full internal state of the generator as text. Reading the text back with
/// set_random_generator_state() resumes exactly the same stream.
std::string random_generator_state(const RandomGeneratorType& gen);

void set_random_generator_state(RandomGeneratorType& gen, const std::string& state);

} // namespace ising

#endif // ISING_HELPERS_RANDOM_H
