#pragma once
// Composition statistics: base counts, GC content, k-mer frequencies,
// Shannon entropy, molecular weight and melting temperature.
//
// All statistics are derived from raw CompositionCounts. Counts from
// disjoint chunks of one sequence add up exactly, so chunked (parallel)
// and single-pass runs give identical results; ratios such as entropy are
// always recomputed from merged counts, never averaged.

#include "nucleo/alphabet.hpp"
#include "nucleo/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nucleo {

// Water lost per phosphodiester bond (Da)
constexpr double WATER_LOSS_MASS = 61.96;

// Length at which melting temperature switches to the GC formula
constexpr size_t TM_LONG_SEQUENCE = 14;

struct CompositionCounts {
    std::array<uint64_t, 256> symbols{};             // by upper-case byte
    std::map<std::string, uint64_t> dinucleotides;   // 2-mers starting in range
    std::map<std::string, uint64_t> trinucleotides;  // 3-mers starting in range
    uint64_t length = 0;

    uint64_t count(char c) const { return symbols[static_cast<unsigned char>(c)]; }
    void merge(const CompositionCounts& other);
};

struct CompositionStats {
    size_t length = 0;
    double gc_content = 0.0;                       // percent, [0, 100]
    std::map<char, size_t> nucleotide_counts;      // symbols present only
    double molecular_weight = 0.0;                 // Da
    std::map<std::string, double> dinucleotide_frequencies;
    std::map<std::string, double> trinucleotide_frequencies;
    double entropy = 0.0;                          // bits
    double melting_temperature = 0.0;              // degrees C
};

/**
 * Count symbols in [begin, end) of an upper-case sequence.
 * k-mers are attributed to the chunk holding their first base and may read
 * past `end`, so adjacent chunks never double count or drop a k-mer.
 */
CompositionCounts count_composition(const std::string& sequence,
                                    size_t begin, size_t end);

inline CompositionCounts count_composition(const std::string& sequence) {
    return count_composition(sequence, 0, sequence.size());
}

CompositionStats stats_from_counts(const CompositionCounts& counts,
                                   SequenceType type = SequenceType::DNA);

// Single-pass statistics; validates first
CompositionStats comprehensive_stats(const std::string& sequence,
                                     const Alphabet& alphabet = {});

/**
 * Same result as comprehensive_stats, computed over fixed-size chunks in
 * parallel (OpenMP when available). num_threads <= 0 uses all cores.
 */
CompositionStats comprehensive_stats_chunked(const std::string& sequence,
                                             const Alphabet& alphabet,
                                             size_t chunk_size,
                                             int num_threads = 0);

// The primitives below accept any string (case-insensitive, no validation)
// and count only the symbols they are defined on.

std::map<char, size_t> nucleotide_counts(const std::string& sequence);

// 100 * (G + C) / length; 0 for an empty sequence
double gc_content(const std::string& sequence);

// Overlapping k-mer frequencies (count / number of k-mers); empty if length < k
std::map<std::string, double> kmer_frequencies(const std::string& sequence, size_t k);

// -sum p*log2(p) over the symbols present
double shannon_entropy(const std::string& sequence);

double molecular_weight(const std::string& sequence,
                        SequenceType type = SequenceType::DNA);

/**
 * length < 14:  Tm = 2*(A+T) + 4*(G+C)
 * length >= 14: Tm = 64.9 + 41*(gc_count - 16.4)/length
 *
 * gc_count is the absolute G+C count, kept in this form for compatibility
 * with previously published results.
 */
double melting_temperature(const std::string& sequence);

// GC percent of each window of `window` bases, advancing by `step`
std::vector<double> sliding_gc_content(const std::string& sequence,
                                       size_t window, size_t step = 1);

} // namespace nucleo
