// bits.cpp

#include "../include/bits.hpp"
#include <bitset>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

BitString bits::mask(const uint32_t &width) {
    return BitString(bits::domain_size(width) - 1);
}

uint64_t bits::domain_size(const uint32_t &width) {
    return uint64_t(1) << width;
}

uint32_t bits::dot(const BitString &a, const BitString &b) {
    return std::bitset<8 * sizeof(BitString)>(a & b).count() & 1;
}

BitString bits::combine(const std::vector<BitString> &vectors, const uint64_t &selection) {
    BitString res = 0;
    for (uint32_t i = 0; i < vectors.size() && i < 64; i++) {
        if (selection & (uint64_t(1) << i)) res ^= vectors[i];
    }
    return res;
}

std::string bits::to_string(const BitString &x, const uint32_t &width) {
    std::string full = std::bitset<8 * sizeof(BitString)>(x).to_string();
    return full.substr(full.size() - width);
}

BitString bits::from_string(const std::string &str) {
    if (str.empty() || str.size() > MAX_WIDTH) {
        throw std::domain_error(
            "bit string \"" + str + "\" must have between 1 and "
            + std::to_string(MAX_WIDTH) + " characters");
    }

    BitString res = 0;
    for (const char c : str) {
        if (c != '0' && c != '1') {
            throw std::domain_error("bit string \"" + str + "\" contains '" + c + "'");
        }
        res = (res << 1) | BitString(c == '1');
    }
    return res;
}

std::vector<uint8_t> bits::to_bit_vector(const BitString &x, const uint32_t &width) {
    std::vector<uint8_t> coords(width);
    for (uint32_t i = 0; i < width; i++) {
        coords[i] = (x >> i) & 1;
    }
    return coords;
}

BitString bits::from_bit_vector(const std::vector<uint8_t> &coords) {
    if (coords.size() > MAX_WIDTH) {
        throw std::domain_error(
            "bit vector of length " + std::to_string(coords.size())
            + " exceeds width " + std::to_string(MAX_WIDTH));
    }

    BitString res = 0;
    for (uint32_t i = 0; i < coords.size(); i++) {
        if (coords[i] & 1) res |= (BitString(1) << i);
    }
    return res;
}
