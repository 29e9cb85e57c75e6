// gf2.cpp

#include "../include/gf2.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

// See https://www.cs.umd.edu/~gasarch/TOPICS/factoring/fastgauss.pdf
// for the algorithm (Gaussian Elimination).
// It's basically this https://en.wikipedia.org/wiki/Kernel_(linear_algebra)#Computation_by_Gaussian_elimination
//
// Rows are single words so eliminating a pivot from a row is one xor
std::vector<int32_t> gf2::reduce(gf2::MatrixRM &matrix) {
    const size_t &cols = matrix.cols, &rows = matrix.rows;
    std::vector<gf2::Word> &data = matrix.row_data;

    // For each linearly indepedent new row, we mark the
    // unique column where it owns the pivot, or -1 if no such column
    std::vector<int32_t> marked_col(rows, -1);

    for (uint32_t r = 0; r < rows; r++) {
        int32_t pivot = -1;
        for (uint32_t c = 0; c < cols; c++) {
            if (data[r] & (gf2::Word(1) << c)) {
                pivot = c;
                break;
            }
        }
        if (pivot == -1) continue;

        marked_col[r] = pivot;
        const gf2::Word pivot_indicator = gf2::Word(1) << pivot;

        // Look over all other rows r2, and if there is a 1
        // in the pivot column, then xor row r into row r2
        for (uint32_t r2 = 0; r2 < rows; r2++) {
            if (r2 == r) continue;
            if (data[r2] & pivot_indicator) data[r2] ^= data[r];
        }
    }
    return marked_col;
}

uint32_t gf2::rank(const gf2::MatrixRM &matrix) {
    gf2::MatrixRM reduced = matrix;
    const std::vector<int32_t> marked_col = gf2::reduce(reduced);
    return std::count_if(marked_col.begin(), marked_col.end(),
            [] (int32_t c) { return c != -1; });
}

gf2::MatrixRM gf2::nullspace(const gf2::MatrixRM &matrix) {
    gf2::MatrixRM reduced = matrix;
    const size_t &cols = matrix.cols, &rows = matrix.rows;
    const std::vector<int32_t> marked_col = gf2::reduce(reduced);

    // Whether a column is marked
    std::vector<bool> is_marked(cols, false);
    for (const int32_t c : marked_col) {
        if (c != -1) is_marked[c] = true;
    }

    std::vector<gf2::Word> kernel;

    // Each unmarked column can be written as a linear combination
    // of the marked columns
    for (uint32_t c = 0; c < cols; c++) {
        if (is_marked[c]) continue;

        const gf2::Word c_indicator = gf2::Word(1) << c;
        gf2::Word vec = c_indicator;

        for (uint32_t r = 0; r < rows; r++) {
            if (marked_col[r] != -1 && (reduced.row_data[r] & c_indicator)) {
                vec |= gf2::Word(1) << marked_col[r];
            }
        }
        kernel.push_back(vec);
    }
    return gf2::MatrixRM{kernel.size(), cols, std::move(kernel)};
}

// Gray code walk, so each new element is one xor away from the last
std::vector<gf2::Word> gf2::span(const gf2::MatrixRM &basis) {
    const size_t &rows = basis.rows;
    const uint64_t total = uint64_t(1) << rows;

    std::vector<gf2::Word> res;
    res.reserve(total);

    gf2::Word cur = 0;
    res.push_back(cur);
    for (uint64_t i = 1; i < total; i++) {
        // The bit that flips between gray(i - 1) and gray(i) is the lowest set bit of i
        uint32_t flip = 0;
        while (!(i & (uint64_t(1) << flip))) flip++;
        cur ^= basis.row_data[flip];
        res.push_back(cur);
    }

    std::sort(res.begin(), res.end());
    return res;
}
