// simon.cpp

#include "../include/bits.hpp"
#include "../include/estimator.hpp"
#include "../include/oracle.hpp"
#include "../include/protocol.hpp"
#include "../include/solver.hpp"
#include "../include/util.hpp"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

const uint32_t MAX_ATTEMPTS = 16;

void print_protocol(const Oracle &oracle, const ProtocolResult &res) {
    const uint32_t n = oracle.get_n_();

    std::cout << "Sampled " << res.batch.size() << " constraints in "
              << res.attempts << " attempt(s):" << std::endl;
    for (const Constraint &constraint : res.batch) {
        std::cout << "  y = " << bits::to_string(constraint.y, n)
                  << ", f(x) = " << bits::to_string(constraint.value, oracle.get_m_())
                  << std::endl;
    }
    std::cout << "Linearly independent: " << (res.independent ? "yes" : "no") << std::endl;

    std::cout << res.solutions.size() << " candidate secret(s):" << std::endl;
    for (uint32_t i = 0; i < res.solutions.size(); i++) {
        std::cout << "  " << bits::to_string(res.solutions[i], n)
                  << (res.verified[i] ? "  f(c) = f(0)" : "  f(c) != f(0)") << std::endl;
    }

    if (res.periodic) {
        std::cout << "f is periodic with secret s = " << bits::to_string(res.secret, n) << std::endl;
    } else {
        std::cout << "f is one-to-one" << std::endl;
    }
}

int main() {
    uint32_t n, m, trials;
    uint64_t seed;
    std::string s_str;

    std::cout << "n: ";
    std::cin >> n;
    std::cout << "m: ";
    std::cin >> m;
    std::cout << "s (binary, 0 for a one-to-one oracle): ";
    std::cin >> s_str;
    std::cout << "trials: ";
    std::cin >> trials;
    std::cout << "seed: ";
    std::cin >> seed;

    if (!std::cin) {
        std::cerr << "Could not read the parameters" << std::endl;
        return 1;
    }

    std::chrono::system_clock::time_point tStart = std::chrono::system_clock::now();

    try {
        const BitString s = bits::from_string(s_str);
        util::RandomSource rng(seed);

        std::cout << "Building " << (s ? "periodic" : "one-to-one") << " oracle" << std::endl;
        const Oracle oracle = make_oracle(n, m, s, rng);

        print_protocol(oracle, run_protocol(oracle, rng, SolveMethod::Elimination, MAX_ATTEMPTS));

        IndependenceEstimator estimator(n, trials, seed);
        std::cout << "Estimating independence probability for n = " << estimator.get_n_()
                  << " over " << estimator.get_trials_() << " trials (seed "
                  << estimator.get_seed_() << ")" << std::endl;

        auto pretty_print = [&] (uint32_t finished) {
            std::cout << "Trial " << finished << " / " << trials << ": "
                      << estimator.get_successes_() << " independent " << '\r' << std::flush;
        };
        EstimateResult res = estimator.Run(pretty_print);
        std::cout << std::endl;

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Empirical probability = " << res.probability << std::endl;
        std::cout << "Theoretical probability = "
                  << theoretical_independence_probability(n).get_d() << std::endl;
        std::cout << "Expected trials to success = " << res.expected_trials << std::endl;
        std::cout << "Variance = " << res.variance << std::endl;
    } catch (const std::domain_error &err) {
        std::cerr << err.what() << std::endl;
        return 1;
    }

    std::cout << "Total time taken: "
              << std::chrono::duration_cast<std::chrono::microseconds>
                 (std::chrono::system_clock::now() - tStart).count() / 1'000'000.0
              << "s"
              << std::endl;
}
