// estimator.hpp
#ifndef ESTIMATOR_HPP_
#define ESTIMATOR_HPP_

#include "solver.hpp"
#include <cstdint>
#include <functional>
#include <gmpxx.h>
#include <mutex>
#include <thread>
#include <vector>

// Which kind of oracle each trial is run against
enum class OracleMode {
    Periodic,
    Injective
};

// Trials treated as independent Bernoulli events with success probability p.
// expected_trials = 1 / p and variance = (1 - p) / p ** 2 are the mean and
// variance of the number of trials up to the first success (geometric
// distribution); both are infinite if no trial succeeded.
struct EstimateResult {
    uint32_t trials;
    uint32_t successes;
    double probability;
    double expected_trials;
    double variance;
};

EstimateResult summarize_trials(const uint32_t trials, const uint32_t successes);

// Exact probability that n - 1 uniform samples of the protocol are linearly
// independent: prod_{i = 0}^{n - 2} (1 - 2 ** (i - d)), where d = n - 1
// for periodic oracles (y ranges over the complement of s) and d = n for
// injective ones.
//
// Throws InvalidParameter if n < 2.
mpq_class theoretical_independence_probability(const uint32_t n,
        const OracleMode mode = OracleMode::Periodic);

// Repeats the full protocol (random nonzero secret, fresh oracle, n - 1
// constraints, independence check) and counts how often the batch is
// independent.
//
// Trial t draws all of its randomness from util::derive_seed(seed, t), so
// the estimate depends only on (n, trials, seed, mode) and not on
// how trials are spread over threads.
class IndependenceEstimator {
private:
    const uint32_t n_;
    const uint32_t trials_;
    const uint64_t seed_;
    const OracleMode mode_;
    const SolveMethod method_;

    uint32_t finished_ = 0;
    uint32_t successes_ = 0;

    // Guards finished_ and successes_, and serializes the progress callback
    std::mutex res_mutex_;

    std::vector<std::thread> threads_;

public:
    // Throws InvalidParameter unless 2 <= n <= MAX_WIDTH and trials > 0.
    IndependenceEstimator(const uint32_t n, const uint32_t trials, const uint64_t seed,
            const OracleMode mode = OracleMode::Periodic,
            const SolveMethod method = SolveMethod::Elimination);

    // Runs every trial.
    // Takes a void(uint32_t) function that runs, holding the result lock,
    // with the number of finished trials every time a trial finishes.
    // It runs on the worker threads and must not throw: an exception
    // escaping a worker ends the process (std::terminate), as does a
    // failure to start a worker thread
    EstimateResult Run(const std::function<void(uint32_t)> &on_finish_trial);
    EstimateResult Run();

    uint32_t get_n_() const;
    uint32_t get_trials_() const;
    uint64_t get_seed_() const;

    // Only meaningful inside the progress callback or after Run
    uint32_t get_finished_() const;
    uint32_t get_successes_() const;
};

// Periodic mode, no progress reporting
EstimateResult estimate_independence_probability(const uint32_t n, const uint32_t trials,
        const uint64_t seed);

#endif // ESTIMATOR_HPP_
