// sampler.hpp
#ifndef SAMPLER_HPP_
#define SAMPLER_HPP_

#include "bits.hpp"
#include "oracle.hpp"
#include "util.hpp"
#include <cstdint>
#include <vector>

// One measurement of the query protocol: y is the linear functional
// (candidate -> y . candidate mod 2) and value = f(x) for the x drawn
// alongside it. Only y is used when solving, value is kept so callers can
// check results against the oracle
struct Constraint {
    BitString y;
    BitString value;
};

typedef std::vector<Constraint> ConstraintBatch;

// Samples measurement outcomes of one fixed oracle.
//
// Injective oracle: y is uniform over all of {0, 1}^n.
// Periodic oracle with secret s: y is uniform over {y : y . s = 0}, which
// is enumerated once here and reused by every draw.
class ConstraintSampler {
private:
    const Oracle &oracle_;
    const uint32_t n_;

    // Orthogonal complement of the secret, in increasing order.
    // Empty for injective oracles
    std::vector<BitString> orthogonal_;

public:
    // The oracle must outlive the sampler
    explicit ConstraintSampler(const Oracle &oracle);

    Constraint SampleRound(util::RandomSource &rng) const;

    // n - 1 independent rounds
    ConstraintBatch SampleBatch(util::RandomSource &rng) const;
    ConstraintBatch SampleBatch(util::RandomSource &rng, const uint32_t count) const;

    const Oracle& get_oracle_() const;
    const std::vector<BitString>& get_orthogonal_() const;
};

// All y with y . s = 0 among the n bit strings, in increasing order
std::vector<BitString> orthogonal_complement(const BitString &s, const uint32_t n);

// One round without a sampler: same distribution as ConstraintSampler::SampleRound,
// drawn in constant time without enumerating the complement of s
Constraint sample_round(const Oracle &oracle, util::RandomSource &rng);

#endif // SAMPLER_HPP_
