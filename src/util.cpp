// util.cpp
#include "../include/util.hpp"

#include <cstdint>
#include <ctime>
#include <gmp.h>
#include <gmpxx.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

InvalidParameter::InvalidParameter(const std::string &what) : std::domain_error(what) {}

util::RandomSource::RandomSource(uint64_t seed) : state_(gmp_randinit_mt), seed_(seed) {
    this->state_.seed(static_cast<unsigned long>(seed));
}

uint64_t util::RandomSource::UniformBelow(uint64_t bound) {
    if (bound == 0) {
        throw std::domain_error("cannot draw uniformly from an empty range");
    }
    mpz_class r = this->state_.get_z_range(mpz_class(static_cast<unsigned long>(bound)));
    return r.get_ui();
}

BitString util::RandomSource::UniformBits(uint32_t width) {
    if (width == 0) return 0;
    mpz_class r = this->state_.get_z_bits(width);
    return BitString(r.get_ui());
}

BitString util::RandomSource::UniformNonzero(uint32_t width) {
    if (width == 0) {
        throw std::domain_error("no nonzero bit string of width 0");
    }
    return BitString(1 + this->UniformBelow(bits::domain_size(width) - 1));
}

void util::RandomSource::Shuffle(std::vector<BitString> &values) {
    for (size_t i = values.size(); i > 1; i--) {
        size_t j = this->UniformBelow(i);
        std::swap(values[i - 1], values[j]);
    }
}

uint64_t util::RandomSource::get_seed_() const { return this->seed_; }

// Same constants as SplitMix64 (Steele, Lea, Flood 2014)
uint64_t util::derive_seed(const uint64_t &base, const uint64_t &index) {
    uint64_t z = base ^ index;
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

double util::seconds_since(const clock_t &t_start) {
    return (double)(clock() - t_start) / CLOCKS_PER_SEC;
}
