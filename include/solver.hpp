// solver.hpp
#ifndef SOLVER_HPP_
#define SOLVER_HPP_

#include "bits.hpp"
#include "gf2.hpp"
#include "oracle.hpp"
#include "sampler.hpp"
#include <cstdint>
#include <vector>

// All s' with y . s' = 0 for every constraint, in increasing order (so 0 first)
typedef std::vector<BitString> SolutionSet;

// BruteForce is the reference: exhaustive subset/candidate search, fine
// for the small n simulated here but exponential in the batch size.
// Elimination does Gaussian elimination over GF(2) and stays polynomial,
// apart from listing the solutions themselves.
// Both give identical answers.
enum class SolveMethod {
    BruteForce,
    Elimination
};

// The batch's y vectors as rows of an n column matrix.
//
// Throws InvalidParameter if n is 0 or above MAX_WIDTH, and std::domain_error
// if some y does not fit in n bits.
gf2::MatrixRM constraint_matrix(const ConstraintBatch &batch, const uint32_t n);

// Dimension of the span of the batch's y vectors
uint32_t rank(const ConstraintBatch &batch, const uint32_t n);

// Whether the y vectors are linearly independent over GF(2), i.e. no
// combination of the others (the empty one included) reproduces any of them.
// An empty batch is independent
bool is_linearly_independent(const ConstraintBatch &batch, const uint32_t n,
        const SolveMethod method = SolveMethod::Elimination);

// Every candidate secret consistent with the batch. Always contains 0;
// an empty batch gives all 2 ** n strings
SolutionSet solve(const ConstraintBatch &batch, const uint32_t n,
        const SolveMethod method = SolveMethod::Elimination);

// For each candidate c, whether oracle(c) == oracle(0). True exactly for
// c in {0, s}, which singles out the real secret among spurious solutions
std::vector<bool> verify_candidates(const Oracle &oracle, const SolutionSet &solutions);

#endif // SOLVER_HPP_
