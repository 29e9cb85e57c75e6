// sampler.cpp

#include "../include/sampler.hpp"
#include "../include/bits.hpp"
#include "../include/oracle.hpp"
#include "../include/util.hpp"
#include <cstdint>
#include <vector>

std::vector<BitString> orthogonal_complement(const BitString &s, const uint32_t n) {
    const uint64_t size = bits::domain_size(n);
    std::vector<BitString> res;
    res.reserve(s == 0 ? size : size / 2);

    for (BitString y = 0; y < size; y++) {
        if (bits::dot(y, s) == 0) res.push_back(y);
    }
    return res;
}

ConstraintSampler::ConstraintSampler(const Oracle &oracle)
    : oracle_(oracle), n_(oracle.get_n_()) {
    if (oracle.is_periodic_()) {
        this->orthogonal_ = orthogonal_complement(oracle.get_secret_(), this->n_);
    }
}

Constraint ConstraintSampler::SampleRound(util::RandomSource &rng) const {
    const BitString x = rng.UniformBits(this->n_);

    // In the periodic case every y with y . s = 1 cancels out, the rest
    // are equally likely. Nothing cancels in the injective case
    BitString y;
    if (this->oracle_.is_periodic_()) {
        y = this->orthogonal_[rng.UniformBelow(this->orthogonal_.size())];
    } else {
        y = rng.UniformBits(this->n_);
    }

    return Constraint{y, this->oracle_(x)};
}

ConstraintBatch ConstraintSampler::SampleBatch(util::RandomSource &rng) const {
    return this->SampleBatch(rng, this->n_ - 1);
}

ConstraintBatch ConstraintSampler::SampleBatch(util::RandomSource &rng,
        const uint32_t count) const {
    ConstraintBatch batch;
    batch.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        batch.push_back(this->SampleRound(rng));
    }
    return batch;
}

const Oracle& ConstraintSampler::get_oracle_() const { return this->oracle_; }
const std::vector<BitString>& ConstraintSampler::get_orthogonal_() const {
    return this->orthogonal_;
}

// Flipping the lowest set bit of s pairs each y with y . s = 1 with exactly
// one y with y . s = 0, so the folded draw is uniform over the complement
Constraint sample_round(const Oracle &oracle, util::RandomSource &rng) {
    const uint32_t n = oracle.get_n_();
    const BitString x = rng.UniformBits(n);

    BitString y = rng.UniformBits(n);
    if (oracle.is_periodic_()) {
        const BitString s = oracle.get_secret_();
        if (bits::dot(y, s)) y ^= s & (~s + 1);
    }

    return Constraint{y, oracle(x)};
}
