#include "nucleo/alignment.hpp"

#include <algorithm>
#include <cmath>

namespace nucleo {

void AlignmentParams::validate() const {
    if (!std::isfinite(match_score) || !std::isfinite(mismatch_score) ||
        !std::isfinite(gap_open) || !std::isfinite(gap_extend)) {
        throw InvalidParameterError("Alignment scores must be finite");
    }
    if (gap_open > 0.0 || gap_extend > 0.0) {
        throw InvalidParameterError("Gap open and gap extend scores must be <= 0");
    }
}

// Gap ramp on row 0 and column 0
static void init_boundaries(ScoreMatrix& S, const AlignmentParams& params) {
    for (size_t i = 1; i < S.rows(); ++i) {
        S(i, 0) = params.gap_open + static_cast<Score>(i - 1) * params.gap_extend;
    }
    for (size_t j = 1; j < S.cols(); ++j) {
        S(0, j) = params.gap_open + static_cast<Score>(j - 1) * params.gap_extend;
    }
}

static void fill_matrices(const std::string& a, const std::string& b,
                          const AlignmentParams& params,
                          ScoreMatrix& S, PointerMatrix& P) {
    const size_t m = a.size();
    const size_t n = b.size();

    for (size_t i = 1; i <= m; ++i) {
        const char ai = a[i - 1];
        for (size_t j = 1; j <= n; ++j) {
            const Score diagonal = S(i - 1, j - 1) +
                (ai == b[j - 1] ? params.match_score : params.mismatch_score);
            const Score up = S(i - 1, j) + params.gap_extend;
            const Score left = S(i, j - 1) + params.gap_extend;

            const Score best = std::max({Score(0), diagonal, up, left});
            S(i, j) = best;

            if (best == 0) {
                P(i, j) = Trace::NONE;
            } else if (best == diagonal) {
                P(i, j) = Trace::DIAGONAL;
            } else if (best == up) {
                P(i, j) = Trace::UP;
            } else {
                P(i, j) = Trace::LEFT;
            }
        }
    }
}

static LocalAlignment trace_back(const std::string& a, const std::string& b,
                                 const ScoreMatrix& S, const PointerMatrix& P,
                                 size_t row, size_t col) {
    LocalAlignment aln;
    aln.end1 = row;
    aln.end2 = col;

    size_t i = row;
    size_t j = col;
    while (i > 0 && j > 0 && P(i, j) != Trace::NONE && S(i, j) > 0) {
        switch (P(i, j)) {
            case Trace::DIAGONAL:
                aln.aligned1 += a[i - 1];
                aln.aligned2 += b[j - 1];
                if (a[i - 1] == b[j - 1]) ++aln.matches;
                --i;
                --j;
                break;
            case Trace::UP:
                aln.aligned1 += a[i - 1];
                aln.aligned2 += GAP_SYMBOL;
                --i;
                break;
            case Trace::LEFT:
                aln.aligned1 += GAP_SYMBOL;
                aln.aligned2 += b[j - 1];
                --j;
                break;
            case Trace::NONE:
                break;
        }
    }

    std::reverse(aln.aligned1.begin(), aln.aligned1.end());
    std::reverse(aln.aligned2.begin(), aln.aligned2.end());
    aln.start1 = i;
    aln.start2 = j;
    return aln;
}

AlignmentResult local_align(const std::string& seq1, const std::string& seq2,
                            const AlignmentParams& params, bool traceback,
                            const Alphabet& alphabet) {
    params.validate();

    // Empty inputs are a defined edge case here, not a validation failure
    const std::string a = seq1.empty() ? std::string() : require_valid(seq1, alphabet);
    const std::string b = seq2.empty() ? std::string() : require_valid(seq2, alphabet);
    const size_t m = a.size();
    const size_t n = b.size();

    AlignmentResult result;
    result.score_matrix = ScoreMatrix(m + 1, n + 1, 0.0);
    result.pointer_matrix = PointerMatrix(m + 1, n + 1, Trace::NONE);
    init_boundaries(result.score_matrix, params);

    if (m == 0 || n == 0) {
        result.score = 0.0;
        if (traceback) result.alignment = LocalAlignment{};
        return result;
    }

    fill_matrices(a, b, params, result.score_matrix, result.pointer_matrix);

    // First maximal cell in row-major order
    const auto& cells = result.score_matrix.data();
    const auto best = std::max_element(cells.begin(), cells.end());
    const size_t flat = static_cast<size_t>(best - cells.begin());
    result.score = *best;
    result.best_row = flat / (n + 1);
    result.best_col = flat % (n + 1);

    if (traceback) {
        result.alignment = trace_back(a, b, result.score_matrix, result.pointer_matrix,
                                      result.best_row, result.best_col);
    }
    return result;
}

std::string to_string(const LocalAlignment& alignment) {
    std::string marks;
    marks.reserve(alignment.length());
    for (size_t k = 0; k < alignment.length(); ++k) {
        const char x = alignment.aligned1[k];
        const char y = alignment.aligned2[k];
        if (x == GAP_SYMBOL || y == GAP_SYMBOL) {
            marks += ' ';
        } else {
            marks += (x == y) ? '|' : '.';
        }
    }
    return alignment.aligned1 + "\n" + marks + "\n" + alignment.aligned2;
}

} // namespace nucleo
