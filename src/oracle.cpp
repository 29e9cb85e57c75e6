// oracle.cpp

#include "../include/oracle.hpp"
#include "../include/bits.hpp"
#include "../include/util.hpp"
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

Oracle::Oracle(uint32_t n, uint32_t m, bool periodic, BitString secret,
        std::vector<BitString> &&table)
    : n_(n), m_(m), periodic_(periodic), secret_(secret), table_(std::move(table)) {}

BitString Oracle::Evaluate(const BitString &x) const {
    if (x >= this->table_.size()) {
        throw std::domain_error(
            "oracle input " + std::to_string(x) + " is outside the "
            + std::to_string(this->n_) + " bit domain");
    }
    return this->table_[x];
}

BitString Oracle::operator()(const BitString &x) const { return this->Evaluate(x); }

uint32_t Oracle::get_n_() const { return this->n_; }
uint32_t Oracle::get_m_() const { return this->m_; }
bool Oracle::is_periodic_() const { return this->periodic_; }
BitString Oracle::get_secret_() const { return this->secret_; }
const std::vector<BitString>& Oracle::get_table_() const { return this->table_; }

void check_widths(const uint32_t n, const uint32_t m) {
    if (n <= 1) {
        throw InvalidParameter("n = " + std::to_string(n) + " must be at least 2");
    }
    if (m < n) {
        throw InvalidParameter(
            "m = " + std::to_string(m) + " must be at least n = " + std::to_string(n));
    }
    if (m > MAX_WIDTH) {
        throw InvalidParameter(
            "m = " + std::to_string(m) + " exceeds the maximum width "
            + std::to_string(MAX_WIDTH));
    }
}

// All 2 ** m outputs in random order
std::vector<BitString> shuffled_pool(const uint32_t m, util::RandomSource &rng) {
    std::vector<BitString> pool(bits::domain_size(m));
    std::iota(pool.begin(), pool.end(), 0);
    rng.Shuffle(pool);
    return pool;
}

Oracle make_injective(const uint32_t n, const uint32_t m, util::RandomSource &rng) {
    check_widths(n, m);

    std::vector<BitString> table = shuffled_pool(m, rng);
    table.resize(bits::domain_size(n));
    table.shrink_to_fit();

    return Oracle(n, m, false, 0, std::move(table));
}

Oracle make_periodic(const uint32_t n, const uint32_t m, const BitString s,
        util::RandomSource &rng) {
    check_widths(n, m);
    if (s == 0) {
        throw InvalidParameter("the secret of a periodic oracle must be nonzero");
    }
    if (s >= bits::domain_size(n)) {
        throw InvalidParameter(
            "secret " + std::to_string(s) + " does not fit in " + std::to_string(n) + " bits");
    }

    const std::vector<BitString> pool = shuffled_pool(m, rng);
    const uint64_t size = bits::domain_size(n);

    std::vector<BitString> table(size);
    std::vector<bool> fixed(size, false);

    // The first x we meet in each orbit {x, x ^ s} is the smaller one.
    // It takes pool[x], which no other orbit representative can take,
    // so the map on orbits is injective
    for (BitString x = 0; x < size; x++) {
        if (fixed[x]) continue;
        table[x] = table[x ^ s] = pool[x];
        fixed[x] = fixed[x ^ s] = true;
    }

    return Oracle(n, m, true, s, std::move(table));
}

Oracle make_oracle(const uint32_t n, const uint32_t m, const BitString s,
        util::RandomSource &rng) {
    if (s == 0) return make_injective(n, m, rng);
    return make_periodic(n, m, s, rng);
}
