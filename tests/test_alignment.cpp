// tests/test_alignment.cpp
//
// Local alignment: matrix shape, boundary ramp, tie-break order, traceback
// and parameter checks.

#include "nucleo/alignment.hpp"
#include "nucleo/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <string>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

std::string random_dna(std::mt19937& rng, size_t len) {
    static const char bases[] = "ACGT";
    std::uniform_int_distribution<int> dist(0, 3);
    std::string s(len, 'A');
    for (auto& c : s) c = bases[dist(rng)];
    return s;
}

int test_self_alignment() {
    std::cout << "[local_align] self alignment scores len * match\n";
    int failed = 0;

    std::mt19937 rng(99);
    for (size_t len : {1u, 2u, 5u, 17u, 60u}) {
        const std::string s = random_dna(rng, len);
        auto r = nucleo::local_align(s, s);
        expect(near(r.score, 2.0 * static_cast<double>(len)),
               "self score for len " + std::to_string(len) + " = " + std::to_string(r.score), failed);
        expect(r.alignment.has_value(), "traceback requested", failed);
        if (r.alignment) {
            expect(r.alignment->aligned1 == s && r.alignment->aligned2 == s,
                   "self alignment strings", failed);
            expect(r.alignment->matches == len, "self alignment matches", failed);
            expect(near(r.alignment->identity(), 1.0), "self identity", failed);
        }
    }

    nucleo::AlignmentParams p;
    p.match_score = 3.5;
    auto r = nucleo::local_align("ACGTACGT", "ACGTACGT", p);
    expect(near(r.score, 28.0), "custom match score", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_scenario_gattaca() {
    std::cout << "[local_align] GATTACA vs GCATGCU\n";
    int failed = 0;

    auto r = nucleo::local_align("GATTACA", "GCATGCU");
    expect(r.score >= 0.0, "score must be non-negative", failed);
    expect(r.score_matrix.rows() == 8 && r.score_matrix.cols() == 8, "score matrix shape", failed);
    expect(r.pointer_matrix.rows() == 8 && r.pointer_matrix.cols() == 8, "pointer matrix shape", failed);
    expect(r.alignment.has_value(), "alignment present", failed);
    if (r.alignment) {
        const auto& aln = *r.alignment;
        expect(aln.aligned1.size() == aln.aligned2.size(), "aligned rows differ in length", failed);
        expect(aln.length() <= 7, "alignment longer than max input length", failed);
        expect(aln.length() > 0, "positive score should give a non-empty alignment", failed);
        expect(aln.end1 - aln.start1 ==
               static_cast<size_t>(std::count_if(aln.aligned1.begin(), aln.aligned1.end(),
                                                 [](char c) { return c != '-'; })),
               "seq1 span matches non-gap symbols", failed);
    }

    // Every interior cell is floored at zero
    for (size_t i = 1; i < r.score_matrix.rows(); ++i) {
        for (size_t j = 1; j < r.score_matrix.cols(); ++j) {
            expect(r.score_matrix(i, j) >= 0.0, "negative interior cell", failed);
        }
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_boundary_ramp() {
    std::cout << "[local_align] boundary gap ramp\n";
    int failed = 0;

    auto r = nucleo::local_align("ACG", "AC");
    expect(near(r.score_matrix(0, 0), 0.0), "origin", failed);
    expect(near(r.score_matrix(1, 0), -10.0), "S[1][0] = gap_open", failed);
    expect(near(r.score_matrix(2, 0), -10.5), "S[2][0] = gap_open + gap_extend", failed);
    expect(near(r.score_matrix(3, 0), -11.0), "S[3][0]", failed);
    expect(near(r.score_matrix(0, 2), -10.5), "S[0][2]", failed);
    expect(r.pointer_matrix(1, 0) == nucleo::Trace::NONE, "boundary pointer", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_tie_breaks() {
    std::cout << "[local_align] pointer tie-break and first argmax\n";
    int failed = 0;

    // Diagonal wins a diagonal/up tie
    nucleo::AlignmentParams flat;
    flat.match_score = 1.0;
    flat.mismatch_score = -1.0;
    flat.gap_open = 0.0;
    flat.gap_extend = 0.0;
    auto r1 = nucleo::local_align("AA", "A", flat);
    expect(r1.pointer_matrix(2, 1) == nucleo::Trace::DIAGONAL, "diagonal should beat up", failed);

    // Up wins an up/left tie
    nucleo::AlignmentParams harsh = flat;
    harsh.mismatch_score = -5.0;
    auto r2 = nucleo::local_align("AG", "AT", harsh);
    expect(r2.pointer_matrix(1, 1) == nucleo::Trace::DIAGONAL, "match cell", failed);
    expect(r2.pointer_matrix(1, 2) == nucleo::Trace::LEFT, "left cell", failed);
    expect(r2.pointer_matrix(2, 1) == nucleo::Trace::UP, "up cell", failed);
    expect(r2.pointer_matrix(2, 2) == nucleo::Trace::UP, "up should beat left", failed);

    // First maximal cell in row-major order
    auto r3 = nucleo::local_align("A", "AA");
    expect(near(r3.score, 2.0), "A vs AA score", failed);
    expect(r3.best_row == 1 && r3.best_col == 1, "argmax should be the first cell", failed);
    expect(near(r3.score_matrix(1, 2), 1.5), "left move after match", failed);
    expect(r3.pointer_matrix(1, 2) == nucleo::Trace::LEFT, "left pointer", failed);

    // Zero score gives a NONE pointer
    auto r4 = nucleo::local_align("A", "C");
    expect(near(r4.score, 0.0), "mismatch only", failed);
    expect(r4.pointer_matrix(1, 1) == nucleo::Trace::NONE, "zero cell pointer", failed);
    expect(r4.alignment && r4.alignment->length() == 0, "zero score gives empty alignment", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_gapped_traceback() {
    std::cout << "[local_align] gapped traceback\n";
    int failed = 0;

    // Cheap gaps so the alignment bridges the inserted base
    nucleo::AlignmentParams p;
    p.gap_open = -1.0;
    p.gap_extend = -1.0;
    auto r = nucleo::local_align("AAAAGGGG", "AAAATGGGG", p);
    expect(near(r.score, 15.0), "score with one gap: " + std::to_string(r.score), failed);
    if (r.alignment) {
        expect(r.alignment->aligned1 == "AAAA-GGGG", "gapped row 1: " + r.alignment->aligned1, failed);
        expect(r.alignment->aligned2 == "AAAATGGGG", "gapped row 2: " + r.alignment->aligned2, failed);
        expect(r.alignment->matches == 8, "matches", failed);
        expect(nucleo::to_string(*r.alignment) == "AAAA-GGGG\n|||| ||||\nAAAATGGGG",
               "rendering", failed);
    } else {
        expect(false, "alignment missing", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_edge_cases() {
    std::cout << "[local_align] empty input, mixed T/U, bad parameters\n";
    int failed = 0;

    auto empty = nucleo::local_align("", "ACGT");
    expect(near(empty.score, 0.0), "empty seq1 score", failed);
    expect(empty.alignment && empty.alignment->length() == 0, "empty seq1 alignment", failed);
    expect(empty.score_matrix.rows() == 1 && empty.score_matrix.cols() == 5, "empty matrix shape", failed);

    auto both_empty = nucleo::local_align("", "");
    expect(near(both_empty.score, 0.0), "both empty", failed);

    auto no_tb = nucleo::local_align("ACGT", "ACGT", {}, false);
    expect(!no_tb.alignment.has_value(), "traceback skipped", failed);
    expect(near(no_tb.score, 8.0), "score without traceback", failed);

    auto mixed = nucleo::local_align("ACGT", "acgu");
    expect(near(mixed.score, 6.0), "T and U do not match: " + std::to_string(mixed.score), failed);

    bool threw = false;
    try {
        nucleo::local_align("ACGT", "ACGX");
    } catch (const nucleo::SequenceError& e) {
        threw = e.kind() == nucleo::ErrorKind::InvalidSymbol;
    }
    expect(threw, "invalid symbol should be rejected", failed);

    threw = false;
    nucleo::AlignmentParams bad;
    bad.gap_extend = 1.0;
    try {
        nucleo::local_align("ACGT", "ACGT", bad);
    } catch (const nucleo::SequenceError& e) {
        threw = e.kind() == nucleo::ErrorKind::InvalidParameter;
    }
    expect(threw, "positive gap score should be rejected", failed);

    threw = false;
    nucleo::AlignmentParams nan_params;
    nan_params.match_score = std::numeric_limits<double>::quiet_NaN();
    try {
        nucleo::local_align("ACGT", "ACGT", nan_params);
    } catch (const nucleo::InvalidParameterError&) {
        threw = true;
    }
    expect(threw, "NaN score should be rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // anonymous namespace

int main() {
    int total = 0;
    total += test_self_alignment();
    total += test_scenario_gattaca();
    total += test_boundary_ramp();
    total += test_tie_breaks();
    total += test_gapped_traceback();
    total += test_edge_cases();

    if (total == 0) {
        std::cout << "\nAll alignment tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
