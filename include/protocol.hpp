// protocol.hpp
#ifndef PROTOCOL_HPP_
#define PROTOCOL_HPP_

#include "bits.hpp"
#include "oracle.hpp"
#include "sampler.hpp"
#include "solver.hpp"
#include "util.hpp"
#include <cstdint>
#include <vector>

// Outcome of one run of the query protocol against an oracle.
//
// periodic is the protocol's verdict, not the oracle's real kind: it is
// set iff some nonzero candidate c passes oracle(c) == oracle(0), and
// secret is then that c (0 otherwise).
struct ProtocolResult {
    ConstraintBatch batch; // last batch sampled
    uint32_t attempts;
    bool independent;
    SolutionSet solutions;
    std::vector<bool> verified; // verified[i] is the oracle check for solutions[i]
    bool periodic;
    BitString secret;
};

// Samples n - 1 constraints, solves them and checks every candidate
// against the oracle. A rank deficient batch is resampled while fewer than
// max_attempts batches have been drawn; the final batch is reported
// either way.
//
// Throws InvalidParameter if max_attempts == 0.
ProtocolResult run_protocol(const Oracle &oracle, util::RandomSource &rng,
        const SolveMethod method = SolveMethod::Elimination,
        const uint32_t max_attempts = 1);

#endif // PROTOCOL_HPP_
