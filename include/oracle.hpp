// oracle.hpp
#ifndef ORACLE_HPP_
#define ORACLE_HPP_

#include "bits.hpp"
#include "util.hpp"
#include <cstdint>
#include <vector>

// The black box f: {0, 1}^n -> {0, 1}^m under test.
//
// Either injective, or periodic with a nonzero secret s, meaning
// f(x) = f(x ^ s) for every x and f is otherwise injective.
// The table is built once by one of the factories below and
// never changes afterwards.
class Oracle {
private:
    uint32_t n_;
    uint32_t m_;
    bool periodic_;
    BitString secret_; // 0 when injective
    std::vector<BitString> table_;

    Oracle(uint32_t n, uint32_t m, bool periodic, BitString secret,
            std::vector<BitString> &&table);

    friend Oracle make_injective(const uint32_t n, const uint32_t m,
            util::RandomSource &rng);
    friend Oracle make_periodic(const uint32_t n, const uint32_t m, const BitString s,
            util::RandomSource &rng);

public:
    // Throws std::domain_error if x >= 2 ** n
    BitString Evaluate(const BitString &x) const;
    BitString operator()(const BitString &x) const;

    uint32_t get_n_() const;
    uint32_t get_m_() const;
    bool is_periodic_() const;
    BitString get_secret_() const;
    const std::vector<BitString>& get_table_() const;
};

// Uniformly random injection, i.e. the first 2 ** n entries of a
// shuffled pool of all 2 ** m outputs.
//
// Throws InvalidParameter unless 2 <= n <= m <= MAX_WIDTH.
Oracle make_injective(const uint32_t n, const uint32_t m, util::RandomSource &rng);

// Random function with f(x) = f(x ^ s) whose values on distinct
// orbits {x, x ^ s} are distinct.
//
// Throws InvalidParameter unless 2 <= n <= m <= MAX_WIDTH and 0 < s < 2 ** n.
Oracle make_periodic(const uint32_t n, const uint32_t m, const BitString s,
        util::RandomSource &rng);

// make_injective if s == 0, otherwise make_periodic
Oracle make_oracle(const uint32_t n, const uint32_t m, const BitString s,
        util::RandomSource &rng);

#endif // ORACLE_HPP_
