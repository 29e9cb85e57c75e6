// bits.hpp
#ifndef BITS_HPP_
#define BITS_HPP_

#include <cstdint>
#include <string>
#include <vector>

// An n-bit unsigned integer, always in [0, 2 ** n).
// Bit i of the integer is coordinate i of the GF(2) vector.
typedef uint32_t BitString;

// Widest domain/codomain we allow; oracle tables hold 2 ** width entries
constexpr uint32_t MAX_WIDTH = 24;

namespace bits {

// Returns 2 ** width - 1, i.e. the all ones string of the given width
BitString mask(const uint32_t &width);

// Returns 2 ** width as a 64 bit value (so width = 32 does not overflow)
uint64_t domain_size(const uint32_t &width);

// GF(2) inner product: parity of a & b
uint32_t dot(const BitString &a, const BitString &b);

// XOR of vectors[i] over every i with bit i of selection set.
// Only the first 64 vectors can be selected; any beyond that are ignored
BitString combine(const std::vector<BitString> &vectors, const uint64_t &selection);

// Fixed width binary representation, most significant bit first
std::string to_string(const BitString &x, const uint32_t &width);

// Inverse of to_string.
//
// Throws std::domain_error if str has a character other than '0' or '1',
// is empty, or is longer than MAX_WIDTH.
BitString from_string(const std::string &str);

// Coordinates of x, least significant bit first
std::vector<uint8_t> to_bit_vector(const BitString &x, const uint32_t &width);
BitString from_bit_vector(const std::vector<uint8_t> &coords);

} // namespace bits

#endif // BITS_HPP_
