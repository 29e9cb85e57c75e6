// estimator.cpp

#include "../include/estimator.hpp"
#include "../include/bits.hpp"
#include "../include/oracle.hpp"
#include "../include/sampler.hpp"
#include "../include/solver.hpp"
#include "../include/util.hpp"
#include <cstdint>
#include <functional>
#include <gmpxx.h>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

const uint32_t THREADS = 8;

EstimateResult summarize_trials(const uint32_t trials, const uint32_t successes) {
    EstimateResult res{trials, successes, 0, 0, 0};
    res.probability = trials == 0 ? 0 : (double)successes / trials;

    if (successes == 0) {
        res.expected_trials = std::numeric_limits<double>::infinity();
        res.variance = std::numeric_limits<double>::infinity();
    } else {
        const double p = res.probability;
        res.expected_trials = 1 / p;
        res.variance = (1 - p) / (p * p);
    }
    return res;
}

mpq_class theoretical_independence_probability(const uint32_t n, const OracleMode mode) {
    if (n < 2) {
        throw InvalidParameter("n = " + std::to_string(n) + " must be at least 2");
    }

    // The i-th sample must avoid the 2 ** i vectors spanned by the first i
    const uint32_t dim = (mode == OracleMode::Periodic) ? n - 1 : n;
    const mpz_class space = mpz_class(1) << dim;

    mpq_class res = 1;
    for (uint32_t i = 0; i + 1 < n; i++) {
        const mpz_class avoid = space - (mpz_class(1) << i);
        mpq_class factor(avoid, space);
        factor.canonicalize();
        res *= factor;
    }
    return res;
}

IndependenceEstimator::IndependenceEstimator(const uint32_t n, const uint32_t trials,
        const uint64_t seed, const OracleMode mode, const SolveMethod method)
    : n_(n), trials_(trials), seed_(seed), mode_(mode), method_(method) {
    if (n < 2 || n > MAX_WIDTH) {
        throw InvalidParameter(
            "n = " + std::to_string(n) + " must be between 2 and " + std::to_string(MAX_WIDTH));
    }
    if (trials == 0) {
        throw InvalidParameter("the estimator needs at least one trial");
    }
}

// One full protocol run with its own random stream
bool RunTrial(const uint32_t n, const uint64_t seed, const OracleMode mode,
        const SolveMethod method) {
    util::RandomSource rng(seed);

    BitString s = 0;
    if (mode == OracleMode::Periodic) s = rng.UniformNonzero(n);

    const Oracle oracle = make_oracle(n, n, s, rng);
    const ConstraintSampler sampler(oracle);
    const ConstraintBatch batch = sampler.SampleBatch(rng);

    return is_linearly_independent(batch, n, method);
}

// Worker thread: runs trials first, first + stride, ...
void RunTrials(const uint32_t first, const uint32_t stride,
        const uint32_t n, const uint32_t trials, const uint64_t seed,
        const OracleMode mode, const SolveMethod method,
        std::mutex &res_mutex, uint32_t &finished, uint32_t &successes,
        const std::function<void(uint32_t)> &on_finish_trial) {
    for (uint32_t t = first; t < trials; t += stride) {
        const bool independent = RunTrial(n, util::derive_seed(seed, t), mode, method);

        std::lock_guard<std::mutex> res_lock(res_mutex);
        finished++;
        if (independent) successes++;
        on_finish_trial(finished);
    }
}

EstimateResult IndependenceEstimator::Run(const std::function<void(uint32_t)> &on_finish_trial) {
    this->finished_ = 0;
    this->successes_ = 0;

    this->threads_.clear();
    this->threads_.reserve(THREADS);
    for (uint32_t t = 0; t < THREADS; t++) {
        this->threads_.push_back(std::thread(RunTrials, t, THREADS,
                    this->n_, this->trials_, this->seed_, this->mode_, this->method_,
                    std::ref(this->res_mutex_), std::ref(this->finished_),
                    std::ref(this->successes_), std::cref(on_finish_trial)));
    }

    for (std::thread &thr : this->threads_) thr.join();
    this->threads_.clear();

    return summarize_trials(this->trials_, this->successes_);
}

EstimateResult IndependenceEstimator::Run() {
    return this->Run([] (uint32_t) {});
}

uint32_t IndependenceEstimator::get_n_() const { return this->n_; }
uint32_t IndependenceEstimator::get_trials_() const { return this->trials_; }
uint64_t IndependenceEstimator::get_seed_() const { return this->seed_; }

uint32_t IndependenceEstimator::get_finished_() const { return this->finished_; }
uint32_t IndependenceEstimator::get_successes_() const { return this->successes_; }

EstimateResult estimate_independence_probability(const uint32_t n, const uint32_t trials,
        const uint64_t seed) {
    IndependenceEstimator estimator(n, trials, seed);
    return estimator.Run();
}
