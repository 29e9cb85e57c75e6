// gf2.hpp
#ifndef GF2_HPP_
#define GF2_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

// All matrices are F2 matrices encoded by bits
// in integer words

namespace gf2 {
    typedef uint64_t Word;

    // Number of bits per Word
    constexpr uint32_t BLOCK = 8 * sizeof(Word);

    // GF(2) matrix stored row-major with each row
    // packed into a single Word, so bit c of row_data[r]
    // is the entry in row r and column c.
    //
    // Assumes that row_data.size() >= rows and cols <= BLOCK
    // (only the first ``cols'' bits of each row are used)
    struct MatrixRM {
        size_t rows;
        size_t cols;
        std::vector<Word> row_data;
    };

    // Puts the matrix in reduced row echelon form in place
    // (rows are not reordered, so zero rows stay where they end up).
    // Returns, for each row, the column of its pivot, or -1 if the row
    // became zero.
    std::vector<int32_t> reduce(MatrixRM &matrix);

    // Dimension of the row space
    uint32_t rank(const MatrixRM &matrix);

    // Returns, in matrix form, a list of vectors (the rows)
    // spanning the nullspace of the matrix, i.e. all v with
    // matrix * v = 0. The basis has cols - rank(matrix) rows.
    MatrixRM nullspace(const MatrixRM &matrix);

    // Every GF(2) combination of the rows of basis, in increasing order.
    // Assumes the rows are linearly independent, so there are exactly
    // 2 ** basis.rows distinct values.
    std::vector<Word> span(const MatrixRM &basis);
};

#endif // GF2_HPP_
