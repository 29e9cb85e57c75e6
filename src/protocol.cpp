// protocol.cpp

#include "../include/protocol.hpp"
#include "../include/oracle.hpp"
#include "../include/sampler.hpp"
#include "../include/solver.hpp"
#include "../include/util.hpp"
#include <cstdint>
#include <vector>

ProtocolResult run_protocol(const Oracle &oracle, util::RandomSource &rng,
        const SolveMethod method, const uint32_t max_attempts) {
    if (max_attempts == 0) {
        throw InvalidParameter("the protocol needs at least one attempt");
    }

    const uint32_t n = oracle.get_n_();
    const ConstraintSampler sampler(oracle);

    ProtocolResult res;
    res.attempts = 0;
    do {
        res.batch = sampler.SampleBatch(rng);
        res.attempts++;
        res.independent = is_linearly_independent(res.batch, n, method);
    } while (!res.independent && res.attempts < max_attempts);

    res.solutions = solve(res.batch, n, method);
    res.verified = verify_candidates(oracle, res.solutions);

    res.periodic = false;
    res.secret = 0;
    for (uint32_t i = 0; i < res.solutions.size(); i++) {
        if (res.solutions[i] != 0 && res.verified[i]) {
            res.periodic = true;
            res.secret = res.solutions[i];
            break;
        }
    }
    return res;
}
