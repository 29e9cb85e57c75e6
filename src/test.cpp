// test.cpp

#include "../include/bits.hpp"
#include "../include/estimator.hpp"
#include "../include/gf2.hpp"
#include "../include/oracle.hpp"
#include "../include/protocol.hpp"
#include "../include/sampler.hpp"
#include "../include/solver.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <set>
#include <stdexcept>
#include <vector>

template<typename TException>
bool throws(const std::function<void()> &f) {
    try {
        f();
    } catch (const TException &) {
        return true;
    }
    return false;
}

void report(const char *name, const clock_t &tStart) {
    std::cout << name << ": " << std::fixed << std::setprecision(3)
              << util::seconds_since(tStart) << "s"
              << std::endl;
}

// Reference rank by counting the distinct subset xors: 2 ** rank of them
uint32_t subset_rank(const std::vector<BitString> &vectors) {
    std::set<BitString> spanned;
    for (uint64_t selection = 0; selection < (uint64_t(1) << vectors.size()); selection++) {
        spanned.insert(bits::combine(vectors, selection));
    }
    uint32_t r = 0;
    while ((size_t(1) << r) < spanned.size()) r++;
    return r;
}

ConstraintBatch batch_of(const std::vector<BitString> &ys) {
    ConstraintBatch batch;
    for (const BitString y : ys) batch.push_back(Constraint{y, 0});
    return batch;
}

void check_bits() {
    clock_t tStart = clock();

    assert(bits::mask(1) == 1);
    assert(bits::mask(10) == 1023);
    assert(bits::domain_size(24) == (uint64_t(1) << 24));

    assert(bits::dot(0b1011, 0b0110) == 1);
    assert(bits::dot(0b1011, 0b1001) == 0);
    assert(bits::dot(0, 0b1111) == 0);

    assert(bits::combine({0b001, 0b010, 0b100}, 0b101) == 0b101);
    assert(bits::combine({0b011, 0b011}, 0b11) == 0);
    assert(bits::combine({0b011, 0b110}, 0) == 0);

    // Selection masks only reach the first 64 vectors
    const std::vector<BitString> many(70, 0b1);
    assert(bits::combine(many, ~uint64_t(0)) == 0);
    assert(bits::combine(many, uint64_t(1) << 63) == 0b1);

    assert(bits::to_string(5, 4) == "0101");
    assert(bits::to_string(0, 3) == "000");
    assert(bits::from_string("0101") == 5);
    assert(bits::from_string("1") == 1);
    for (BitString x = 0; x < 256; x++) {
        assert(bits::from_string(bits::to_string(x, 8)) == x);
    }
    assert(throws<std::domain_error>([] { bits::from_string(""); }));
    assert(throws<std::domain_error>([] { bits::from_string("10a1"); }));
    assert(throws<std::domain_error>([] { bits::from_string(std::string(MAX_WIDTH + 1, '1')); }));

    std::vector<uint8_t> coords = bits::to_bit_vector(0b110, 4);
    assert((coords == std::vector<uint8_t>{0, 1, 1, 0}));
    assert(bits::from_bit_vector(coords) == 0b110);

    report("bits", tStart);
}

void check_random_source() {
    clock_t tStart = clock();

    util::RandomSource rng1(1234), rng2(1234);
    for (int i = 0; i < 1000; i++) {
        uint64_t a = rng1.UniformBelow(1000);
        assert(a == rng2.UniformBelow(1000));
        assert(a < 1000);

        BitString b = rng1.UniformBits(7);
        assert(b == rng2.UniformBits(7));
        assert(b < 128);

        BitString c = rng1.UniformNonzero(3);
        assert(c == rng2.UniformNonzero(3));
        assert(c >= 1 && c < 8);
    }
    assert(rng1.get_seed_() == 1234);

    std::vector<BitString> values(100);
    std::iota(values.begin(), values.end(), 0);
    rng1.Shuffle(values);
    std::vector<BitString> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    for (BitString i = 0; i < 100; i++) assert(sorted[i] == i);

    assert(throws<std::domain_error>([&rng1] { rng1.UniformBelow(0); }));
    assert(throws<std::domain_error>([&rng1] { rng1.UniformNonzero(0); }));

    // Distinct trial streams
    assert(util::derive_seed(7, 0) != util::derive_seed(7, 1));
    assert(util::derive_seed(7, 3) == util::derive_seed(7, 3));

    report("util::RandomSource", tStart);
}

void check_make_injective() {
    clock_t tStart = clock();
    util::RandomSource rng(1);

    for (uint32_t n = 2; n <= 12; n++) {
        const Oracle oracle = make_injective(n, n, rng);
        assert(!oracle.is_periodic_());
        assert(oracle.get_secret_() == 0);

        std::vector<BitString> table = oracle.get_table_();
        assert(table.size() == bits::domain_size(n));
        std::sort(table.begin(), table.end());
        for (BitString x = 0; x < table.size(); x++) assert(table[x] == x);
    }

    // Wider codomain: still injective, values in range
    for (uint32_t n = 2; n <= 8; n++) {
        const Oracle oracle = make_injective(n, n + 4, rng);
        const std::vector<BitString> &table = oracle.get_table_();
        std::set<BitString> values(table.begin(), table.end());
        assert(values.size() == table.size());
        assert(*values.rbegin() <= bits::mask(n + 4));
    }

    // Same seed, same oracle
    util::RandomSource rng1(99), rng2(99);
    assert(make_injective(8, 8, rng1).get_table_() == make_injective(8, 8, rng2).get_table_());

    report("make_injective", tStart);
}

void check_periodic_table(const Oracle &oracle) {
    const uint32_t n = oracle.get_n_();
    const BitString s = oracle.get_secret_();

    std::set<BitString> orbit_values;
    for (BitString x = 0; x < bits::domain_size(n); x++) {
        assert(oracle(x) == oracle(x ^ s));
        assert(oracle(x) <= bits::mask(oracle.get_m_()));
        if (x < (x ^ s)) orbit_values.insert(oracle(x));
    }
    // Injective on orbit representatives
    assert(orbit_values.size() == bits::domain_size(n) / 2);
}

void check_make_periodic() {
    clock_t tStart = clock();
    util::RandomSource rng(2);

    for (uint32_t n = 2; n <= 6; n++) {
        for (BitString s = 1; s < bits::domain_size(n); s++) {
            const Oracle oracle = make_periodic(n, n, s, rng);
            assert(oracle.is_periodic_());
            assert(oracle.get_secret_() == s);
            check_periodic_table(oracle);
        }
    }
    for (uint32_t n = 7; n <= 14; n++) {
        for (int rep = 0; rep < 4; rep++) {
            check_periodic_table(make_periodic(n, n, rng.UniformNonzero(n), rng));
        }
        check_periodic_table(make_periodic(n, n + 2, rng.UniformNonzero(n), rng));
    }

    // n = 2, s = 01
    const Oracle small = make_periodic(2, 2, 1, rng);
    assert(small(0) == small(1));
    assert(small(2) == small(3));
    assert(small(0) != small(2));
    assert(small(0) < 4 && small(2) < 4);

    assert(make_oracle(5, 5, 0, rng).is_periodic_() == false);
    assert(make_oracle(5, 5, 3, rng).get_secret_() == 3);

    report("make_periodic", tStart);
}

void check_invalid_parameters() {
    clock_t tStart = clock();
    util::RandomSource rng(3);

    assert(throws<InvalidParameter>([&rng] { make_injective(1, 1, rng); }));
    assert(throws<InvalidParameter>([&rng] { make_injective(0, 4, rng); }));
    assert(throws<InvalidParameter>([&rng] { make_injective(5, 4, rng); }));
    assert(throws<InvalidParameter>([&rng] { make_injective(4, MAX_WIDTH + 1, rng); }));
    assert(throws<InvalidParameter>([&rng] { make_periodic(4, 4, 0, rng); }));
    assert(throws<InvalidParameter>([&rng] { make_periodic(4, 4, 16, rng); }));
    assert(throws<InvalidParameter>([&rng] { make_periodic(4, 3, 1, rng); }));
    assert(throws<InvalidParameter>([&rng] { make_periodic(1, 1, 1, rng); }));

    assert(throws<InvalidParameter>([] { IndependenceEstimator(1, 10, 0); }));
    assert(throws<InvalidParameter>([] { IndependenceEstimator(4, 0, 0); }));
    assert(throws<InvalidParameter>([] { theoretical_independence_probability(1); }));
    assert(throws<InvalidParameter>([] { solve(ConstraintBatch{}, 0); }));

    const Oracle oracle = make_periodic(3, 3, 5, rng);
    assert(throws<InvalidParameter>([&] { run_protocol(oracle, rng, SolveMethod::Elimination, 0); }));
    assert(throws<std::domain_error>([&oracle] { oracle(8); }));
    assert(throws<std::domain_error>([] { rank(batch_of({0b1000}), 3); }));

    report("invalid parameters", tStart);
}

void check_sampler() {
    clock_t tStart = clock();
    util::RandomSource rng(4);

    for (uint32_t n = 2; n <= 10; n++) {
        const BitString s = rng.UniformNonzero(n);
        const Oracle oracle = make_periodic(n, n, s, rng);
        const ConstraintSampler sampler(oracle);

        assert(sampler.get_orthogonal_().size() == bits::domain_size(n - 1));
        assert(sampler.get_orthogonal_() == orthogonal_complement(s, n));

        const std::vector<BitString> &table = oracle.get_table_();
        for (int i = 0; i < 2000; i++) {
            const Constraint c = sampler.SampleRound(rng);
            assert(bits::dot(c.y, s) == 0);
            assert(std::find(table.begin(), table.end(), c.value) != table.end());
        }

        const ConstraintBatch batch = sampler.SampleBatch(rng);
        assert(batch.size() == n - 1);
        for (const Constraint &c : batch) assert(bits::dot(c.y, s) == 0);
        assert(sampler.SampleBatch(rng, 3).size() == 3);

        assert(&sampler.get_oracle_() == &oracle);
        assert(bits::dot(sample_round(oracle, rng).y, s) == 0);
    }

    // Periodic: every vector orthogonal to s shows up, from the sampler
    // and from the standalone draw alike
    for (const BitString s : {BitString(0b0001), BitString(0b0110), BitString(0b1111)}) {
        const Oracle oracle = make_periodic(4, 4, s, rng);
        const ConstraintSampler sampler(oracle);
        std::set<BitString> seen_sampler, seen_round;
        for (int i = 0; i < 2000; i++) {
            seen_sampler.insert(sampler.SampleRound(rng).y);
            seen_round.insert(sample_round(oracle, rng).y);
        }
        const std::vector<BitString> &orthogonal = sampler.get_orthogonal_();
        assert(seen_sampler == std::set<BitString>(orthogonal.begin(), orthogonal.end()));
        assert(seen_round == seen_sampler);
        assert(seen_round.size() == 8);
    }

    // Standalone draws at a large width stay cheap: the complement
    // (2 ** 19 vectors here) is never enumerated
    {
        const uint32_t n = 20;
        const BitString s = rng.UniformNonzero(n);
        const Oracle oracle = make_periodic(n, n, s, rng);
        clock_t tRounds = clock();
        for (int i = 0; i < 20000; i++) {
            const Constraint c = sample_round(oracle, rng);
            assert(c.y <= bits::mask(n));
            assert(bits::dot(c.y, s) == 0);
        }
        std::cout << "sample_round x 20000 (n = 20): " << std::fixed << std::setprecision(3)
                  << util::seconds_since(tRounds) << "s" << std::endl;
        assert(util::seconds_since(tRounds) < 5.0);
    }

    // Injective: y ranges over the whole space, so every value shows up
    const Oracle injective = make_injective(4, 4, rng);
    const ConstraintSampler sampler(injective);
    assert(sampler.get_orthogonal_().empty());
    std::set<BitString> seen;
    for (int i = 0; i < 2000; i++) seen.insert(sampler.SampleRound(rng).y);
    assert(seen.size() == 16);

    report("ConstraintSampler", tStart);
}

void check_gf2() {
    clock_t tStart = clock();

    // Rows 011, 110: kernel of x1 + x0 = 0, x2 + x1 = 0 is {000, 111}
    gf2::MatrixRM matrix{2, 3, {0b011, 0b110}};
    assert(gf2::rank(matrix) == 2);
    gf2::MatrixRM kernel = gf2::nullspace(matrix);
    assert(kernel.rows == 1);
    assert(kernel.row_data[0] == 0b111);
    assert((gf2::span(kernel) == std::vector<gf2::Word>{0, 0b111}));

    // Dependent rows
    gf2::MatrixRM dependent{3, 4, {0b0011, 0b0101, 0b0110}};
    assert(gf2::rank(dependent) == 2);
    std::vector<int32_t> marked_col = gf2::reduce(dependent);
    assert(std::count(marked_col.begin(), marked_col.end(), -1) == 1);

    // Random matrices against subset search
    util::RandomSource rng(5);
    for (int rep = 0; rep < 500; rep++) {
        const uint32_t cols = 1 + rng.UniformBelow(12);
        const uint32_t rows = rng.UniformBelow(cols + 3);
        gf2::MatrixRM sample{rows, cols, {}};
        std::vector<BitString> vectors;
        for (uint32_t r = 0; r < rows; r++) {
            vectors.push_back(rng.UniformBits(cols));
            sample.row_data.push_back(vectors.back());
        }

        const uint32_t r = gf2::rank(sample);
        assert(r == subset_rank(vectors));

        gf2::MatrixRM basis = gf2::nullspace(sample);
        assert(basis.rows == cols - r);
        for (const gf2::Word vec : gf2::span(basis)) {
            for (const BitString y : vectors) assert(bits::dot(y, vec) == 0);
        }
    }

    report("gf2::nullspace", tStart);
}

void check_solver() {
    clock_t tStart = clock();
    util::RandomSource rng(6);

    // Empty batch: independent, every candidate consistent
    for (const SolveMethod method : {SolveMethod::BruteForce, SolveMethod::Elimination}) {
        assert(is_linearly_independent(ConstraintBatch{}, 4, method));
        SolutionSet all = solve(ConstraintBatch{}, 4, method);
        assert(all.size() == 16);
        assert(all.front() == 0);
    }

    // Zero vector and repeated vectors are dependent
    for (const SolveMethod method : {SolveMethod::BruteForce, SolveMethod::Elimination}) {
        assert(!is_linearly_independent(batch_of({0b000}), 3, method));
        assert(!is_linearly_independent(batch_of({0b101, 0b101}), 3, method));
        assert(!is_linearly_independent(batch_of({0b011, 0b101, 0b110}), 3, method));
        assert(is_linearly_independent(batch_of({0b011, 0b101}), 3, method));
        assert(!is_linearly_independent(batch_of({1, 2, 4, 3}), 3, method));
        assert((solve(batch_of({0b011, 0b101}), 3, method) == SolutionSet{0, 0b111}));
    }

    // Both methods agree on random batches
    for (int rep = 0; rep < 400; rep++) {
        const uint32_t n = 2 + rng.UniformBelow(7);
        const uint32_t size = rng.UniformBelow(n + 2);
        ConstraintBatch batch;
        for (uint32_t i = 0; i < size; i++) batch.push_back(Constraint{rng.UniformBits(n), 0});

        const bool independent = is_linearly_independent(batch, n, SolveMethod::BruteForce);
        assert(independent == is_linearly_independent(batch, n, SolveMethod::Elimination));
        assert(independent == (rank(batch, n) == size));

        const SolutionSet brute = solve(batch, n, SolveMethod::BruteForce);
        const SolutionSet elim = solve(batch, n, SolveMethod::Elimination);
        assert(brute == elim);
        assert(brute.front() == 0);
        assert(brute.size() == bits::domain_size(n - rank(batch, n)));
        assert(std::is_sorted(elim.begin(), elim.end()));

        // No hidden state
        assert(independent == is_linearly_independent(batch, n, SolveMethod::BruteForce));
    }

    // Largest size we simulate
    const uint32_t n = 16;
    const Oracle oracle = make_periodic(n, n, rng.UniformNonzero(n), rng);
    const ConstraintBatch batch = ConstraintSampler(oracle).SampleBatch(rng);
    assert(is_linearly_independent(batch, n, SolveMethod::BruteForce)
            == is_linearly_independent(batch, n, SolveMethod::Elimination));
    assert(solve(batch, n, SolveMethod::BruteForce) == solve(batch, n, SolveMethod::Elimination));

    report("solve", tStart);
}

void check_verification() {
    clock_t tStart = clock();
    util::RandomSource rng(7);

    // Rank deficient (empty) batch: every candidate survives solving,
    // only 0 and s survive the oracle check
    const BitString s = 0b1010;
    const Oracle oracle = make_periodic(4, 4, s, rng);
    const SolutionSet all = solve(ConstraintBatch{}, 4);
    const std::vector<bool> verified = verify_candidates(oracle, all);
    for (uint32_t i = 0; i < all.size(); i++) {
        assert(verified[i] == (all[i] == 0 || all[i] == s));
    }

    // Injective: only 0 verifies
    const Oracle injective = make_injective(4, 4, rng);
    const std::vector<bool> verified_inj = verify_candidates(injective, all);
    for (uint32_t i = 0; i < all.size(); i++) {
        assert(verified_inj[i] == (all[i] == 0));
    }

    report("verify_candidates", tStart);
}

void check_protocol() {
    clock_t tStart = clock();
    util::RandomSource rng(8);

    for (uint32_t n = 2; n <= 12; n++) {
        for (const SolveMethod method : {SolveMethod::BruteForce, SolveMethod::Elimination}) {
            const BitString s = rng.UniformNonzero(n);
            const Oracle oracle = make_periodic(n, n, s, rng);
            const ProtocolResult res = run_protocol(oracle, rng, method, 64);

            assert(res.attempts >= 1 && res.attempts <= 64);
            assert(res.batch.size() == n - 1);
            assert(res.independent);
            assert((res.solutions == SolutionSet{0, s}));
            assert(res.verified[0] && res.verified[1]);
            assert(res.periodic);
            assert(res.secret == s);

            const Oracle injective = make_injective(n, n, rng);
            const ProtocolResult res_inj = run_protocol(injective, rng, method, 64);
            assert(!res_inj.periodic);
            assert(res_inj.secret == 0);
            assert(res_inj.solutions.front() == 0 && res_inj.verified[0]);
        }
    }

    // A single attempt may leave extra candidates, but the verdict still holds
    for (int rep = 0; rep < 50; rep++) {
        const Oracle oracle = make_periodic(6, 6, rng.UniformNonzero(6), rng);
        const ProtocolResult res = run_protocol(oracle, rng);
        assert(res.attempts == 1);
        assert(res.periodic && res.secret == oracle.get_secret_());
        assert(res.independent == (res.solutions.size() == 2));
    }

    report("run_protocol", tStart);
}

void check_theoretical_probability() {
    clock_t tStart = clock();

    assert(theoretical_independence_probability(2) == mpq_class(1, 2));
    assert(theoretical_independence_probability(2, OracleMode::Injective) == mpq_class(3, 4));
    // (1 - 1/4) (1 - 1/2)
    assert(theoretical_independence_probability(3) == mpq_class(3, 8));

    const double p10 = theoretical_independence_probability(10).get_d();
    assert(p10 > 0.288 && p10 < 0.290);

    report("theoretical_independence_probability", tStart);
}

void check_summarize_trials() {
    EstimateResult res = summarize_trials(4, 2);
    assert(res.probability == 0.5);
    assert(res.expected_trials == 2);
    assert(res.variance == 2);

    res = summarize_trials(10, 0);
    assert(res.probability == 0);
    assert(std::isinf(res.expected_trials));
    assert(std::isinf(res.variance));

    res = summarize_trials(5, 5);
    assert(res.expected_trials == 1);
    assert(res.variance == 0);
}

// Is the estimate within 5 standard errors of the exact probability
bool plausible(const EstimateResult &res, const double p) {
    const double std_err = std::sqrt(p * (1 - p) / res.trials);
    return std::fabs(res.probability - p) < 5 * std_err;
}

void check_estimator() {
    clock_t tStart = clock();

    const EstimateResult res = estimate_independence_probability(10, 1000, 2024);
    assert(res.trials == 1000);
    assert(plausible(res, theoretical_independence_probability(10).get_d()));
    assert(std::fabs(res.expected_trials - 1 / res.probability) < 1e-9);

    std::cout << "n = 10: p = " << std::fixed << std::setprecision(4) << res.probability
              << ", expected trials = " << res.expected_trials
              << ", variance = " << res.variance << std::endl;

    // Reproducible whatever the thread interleaving
    const EstimateResult again = estimate_independence_probability(10, 1000, 2024);
    assert(again.successes == res.successes);

    IndependenceEstimator injective(6, 2000, 17, OracleMode::Injective, SolveMethod::BruteForce);
    assert(injective.get_n_() == 6);
    assert(injective.get_trials_() == 2000);
    assert(injective.get_seed_() == 17);
    uint32_t calls = 0;
    const EstimateResult res_inj = injective.Run([&calls] (uint32_t) { calls++; });
    assert(calls == 2000);
    assert(injective.get_finished_() == 2000);
    assert(injective.get_successes_() == res_inj.successes);
    assert(plausible(res_inj,
                theoretical_independence_probability(6, OracleMode::Injective).get_d()));

    report("IndependenceEstimator", tStart);
}

int main() {
    check_bits();
    check_random_source();
    check_make_injective();
    check_make_periodic();
    check_invalid_parameters();
    check_sampler();
    check_gf2();
    check_solver();
    check_verification();
    check_protocol();
    check_theoretical_probability();
    check_summarize_trials();
    check_estimator();
}
