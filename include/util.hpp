// util.hpp
#ifndef UTIL_HPP_
#define UTIL_HPP_

#include "bits.hpp"
#include <cstdint>
#include <ctime>
#include <gmpxx.h>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when a simulation is requested with parameters outside
// the problem's promise (bad widths, zero or out of range secret)
class InvalidParameter : public std::domain_error {
public:
    explicit InvalidParameter(const std::string &what);
};

namespace util {

// Pseudorandom source backed by GMP's Mersenne Twister.
//
// Every operation that consumes randomness takes one of these by reference,
// so a run is reproducible from its seed. Not copyable (neither is gmp_randclass).
class RandomSource {
private:
    gmp_randclass state_;
    uint64_t seed_;

public:
    explicit RandomSource(uint64_t seed);

    RandomSource(const RandomSource &rhs) = delete;
    RandomSource& operator=(const RandomSource &rhs) = delete;

    // Uniform in [0, bound)
    //
    // Throws std::domain_error if bound == 0.
    uint64_t UniformBelow(uint64_t bound);

    // Uniform in [0, 2 ** width)
    BitString UniformBits(uint32_t width);

    // Uniform in [1, 2 ** width)
    //
    // Throws std::domain_error if width == 0.
    BitString UniformNonzero(uint32_t width);

    // Fisher-Yates
    void Shuffle(std::vector<BitString> &values);

    uint64_t get_seed_() const;
};

// Mixes (base, index) into a new seed with the SplitMix64 finalizer,
// used to give each independent trial its own stream
uint64_t derive_seed(const uint64_t &base, const uint64_t &index);

// Seconds elapsed since t_start (a clock() reading)
double seconds_since(const clock_t &t_start);

} // namespace util

#endif // UTIL_HPP_
