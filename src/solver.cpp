// solver.cpp

#include "../include/solver.hpp"
#include "../include/bits.hpp"
#include "../include/gf2.hpp"
#include "../include/oracle.hpp"
#include "../include/sampler.hpp"
#include "../include/util.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Each constraint becomes a single packed row
static_assert(MAX_WIDTH <= gf2::BLOCK, "a BitString must fit in one gf2::Word");

gf2::MatrixRM constraint_matrix(const ConstraintBatch &batch, const uint32_t n) {
    if (n == 0 || n > MAX_WIDTH) {
        throw InvalidParameter(
            "n = " + std::to_string(n) + " must be between 1 and " + std::to_string(MAX_WIDTH));
    }

    std::vector<gf2::Word> rows;
    rows.reserve(batch.size());
    for (const Constraint &constraint : batch) {
        if (constraint.y > bits::mask(n)) {
            throw std::domain_error(
                "constraint " + std::to_string(constraint.y) + " does not fit in "
                + std::to_string(n) + " bits");
        }
        rows.push_back(constraint.y);
    }
    return gf2::MatrixRM{batch.size(), n, std::move(rows)};
}

uint32_t rank(const ConstraintBatch &batch, const uint32_t n) {
    return gf2::rank(constraint_matrix(batch, n));
}

// For every vector, try every subset of the remaining vectors
// (the empty subset too, which catches a zero vector) and check
// that none of them xors to it
bool brute_force_independent(const std::vector<BitString> &vectors) {
    const uint32_t size = vectors.size();

    for (uint32_t i = 0; i < size; i++) {
        std::vector<BitString> others;
        others.reserve(size - 1);
        for (uint32_t j = 0; j < size; j++) {
            if (j != i) others.push_back(vectors[j]);
        }

        for (uint64_t selection = 0; selection < (uint64_t(1) << others.size()); selection++) {
            if (bits::combine(others, selection) == vectors[i]) return false;
        }
    }
    return true;
}

bool is_linearly_independent(const ConstraintBatch &batch, const uint32_t n,
        const SolveMethod method) {
    const gf2::MatrixRM matrix = constraint_matrix(batch, n);

    // More than n vectors in an n dimensional space are always dependent
    // (and would make the subset search below overflow its mask)
    if (batch.size() > n) return false;

    if (method == SolveMethod::BruteForce) {
        return brute_force_independent(
            std::vector<BitString>(matrix.row_data.begin(), matrix.row_data.end()));
    }
    return gf2::rank(matrix) == batch.size();
}

SolutionSet solve(const ConstraintBatch &batch, const uint32_t n,
        const SolveMethod method) {
    const gf2::MatrixRM matrix = constraint_matrix(batch, n);

    SolutionSet solutions;
    if (method == SolveMethod::BruteForce) {
        for (BitString candidate = 0; candidate < bits::domain_size(n); candidate++) {
            bool consistent = true;
            for (const gf2::Word y : matrix.row_data) {
                if (bits::dot(BitString(y), candidate)) {
                    consistent = false;
                    break;
                }
            }
            if (consistent) solutions.push_back(candidate);
        }
        return solutions;
    }

    const std::vector<gf2::Word> kernel = gf2::span(gf2::nullspace(matrix));
    solutions.reserve(kernel.size());
    for (const gf2::Word vec : kernel) solutions.push_back(BitString(vec));
    return solutions;
}

std::vector<bool> verify_candidates(const Oracle &oracle, const SolutionSet &solutions) {
    const BitString at_zero = oracle(0);

    std::vector<bool> verified;
    verified.reserve(solutions.size());
    for (const BitString candidate : solutions) {
        verified.push_back(oracle(candidate) == at_zero);
    }
    return verified;
}
