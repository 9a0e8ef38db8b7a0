#pragma once
// Smith-Waterman local alignment
//
// Rows follow seq1, columns follow seq2; both matrices are
// (len(seq1)+1) x (len(seq2)+1). Boundary cells hold the gap ramp
//   S[0][j] = gap_open + (j-1)*gap_extend,  S[i][0] = gap_open + (i-1)*gap_extend
// (S[0][0] = 0), i.e. the cost of an all-gap prefix, rather than the
// zero boundary of textbook Smith-Waterman. Interior cells are
//   S[i][j] = max(0, diag + s(a,b), up + gap_extend, left + gap_extend)
// and never negative.

#include "nucleo/alphabet.hpp"
#include "nucleo/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nucleo {

/**
 * Dense row-major 2D grid
 */
template <typename T>
class Matrix {
public:
    Matrix() = default;
    Matrix(size_t rows, size_t cols, const T& fill = T{})
        : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

    T& operator()(size_t row, size_t col) { return data_[row * cols_ + col]; }
    const T& operator()(size_t row, size_t col) const { return data_[row * cols_ + col]; }

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    const std::vector<T>& data() const { return data_; }

    bool operator==(const Matrix& other) const = default;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<T> data_;
};

// Which recurrence term produced a cell; ties resolve DIAGONAL > UP > LEFT
enum class Trace : uint8_t {
    NONE = 0,
    DIAGONAL = 1,
    UP = 2,
    LEFT = 3
};

using ScoreMatrix = Matrix<Score>;
using PointerMatrix = Matrix<Trace>;

constexpr char GAP_SYMBOL = '-';

struct AlignmentParams {
    Score match_score = 2.0;
    Score mismatch_score = -1.0;
    Score gap_open = -10.0;
    Score gap_extend = -0.5;

    // Finite values, gap scores <= 0; throws InvalidParameterError
    void validate() const;

    bool operator==(const AlignmentParams& other) const = default;
};

struct LocalAlignment {
    std::string aligned1;       // seq1 row, '-' for gaps
    std::string aligned2;       // seq2 row, '-' for gaps
    Position start1 = 0;        // Aligned span in seq1 [start1, end1)
    Position end1 = 0;
    Position start2 = 0;        // Aligned span in seq2 [start2, end2)
    Position end2 = 0;
    size_t matches = 0;

    size_t length() const { return aligned1.size(); }
    double identity() const {
        return aligned1.empty() ? 0.0
                                : static_cast<double>(matches) / static_cast<double>(aligned1.size());
    }

    bool operator==(const LocalAlignment& other) const = default;
};

struct AlignmentResult {
    Score score = 0.0;                        // Maximum over the score matrix
    std::optional<LocalAlignment> alignment;  // Set when traceback was requested
    ScoreMatrix score_matrix;
    PointerMatrix pointer_matrix;
    Position best_row = 0;                    // First argmax cell in row-major order
    Position best_col = 0;

    bool operator==(const AlignmentResult& other) const = default;
};

/**
 * Local alignment of two nucleotide sequences.
 *
 * Inputs are validated against `alphabet` (default: A,C,G,T,U), compared
 * case-insensitively. An empty input gives score 0 and an empty alignment.
 * Time and memory are O(len(seq1) * len(seq2)).
 *
 * @param traceback Also recover the best alignment by following pointers
 *                  from the best cell until a NONE pointer or a zero score
 */
AlignmentResult local_align(const std::string& seq1, const std::string& seq2,
                            const AlignmentParams& params = {},
                            bool traceback = true,
                            const Alphabet& alphabet = Alphabet::nucleic());

// Three-line rendering: seq1 row, match line ('|' match, '.' mismatch, ' ' gap), seq2 row
std::string to_string(const LocalAlignment& alignment);

} // namespace nucleo
