#include "nucleo/composition.hpp"
#include "nucleo/codon_tables.hpp"

#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace nucleo {

// Nucleoside monophosphate weights (Da)
static double monomer_weight(char base, SequenceType type) {
    if (type == SequenceType::RNA) {
        switch (base) {
            case 'A': return 347.2212;  // AMP
            case 'C': return 323.1965;  // CMP
            case 'G': return 363.2206;  // GMP
            case 'U': return 324.1813;  // UMP
            default: return 0.0;
        }
    }
    switch (base) {
        case 'A': return 331.2218;  // dAMP
        case 'C': return 307.1971;  // dCMP
        case 'G': return 347.2212;  // dGMP
        case 'T': return 322.2085;  // dTMP
        case 'U': return type == SequenceType::NUCLEIC ? 324.1813 : 0.0;
        default: return 0.0;
    }
}

void CompositionCounts::merge(const CompositionCounts& other) {
    for (size_t i = 0; i < symbols.size(); ++i) {
        symbols[i] += other.symbols[i];
    }
    for (const auto& [kmer, n] : other.dinucleotides) {
        dinucleotides[kmer] += n;
    }
    for (const auto& [kmer, n] : other.trinucleotides) {
        trinucleotides[kmer] += n;
    }
    length += other.length;
}

CompositionCounts count_composition(const std::string& sequence,
                                    size_t begin, size_t end) {
    CompositionCounts counts;
    const size_t n = sequence.size();
    end = std::min(end, n);
    if (begin >= end) return counts;

    for (size_t i = begin; i < end; ++i) {
        counts.symbols[static_cast<unsigned char>(sequence[i])]++;
    }
    counts.length = end - begin;

    for (size_t i = begin; i < end && i + 2 <= n; ++i) {
        counts.dinucleotides[sequence.substr(i, 2)]++;
    }
    for (size_t i = begin; i < end && i + 3 <= n; ++i) {
        counts.trinucleotides[sequence.substr(i, 3)]++;
    }
    return counts;
}

static std::map<std::string, double> to_frequencies(
    const std::map<std::string, uint64_t>& kmers) {
    std::map<std::string, double> freq;
    uint64_t total = 0;
    for (const auto& [kmer, n] : kmers) total += n;
    if (total == 0) return freq;
    for (const auto& [kmer, n] : kmers) {
        freq[kmer] = static_cast<double>(n) / static_cast<double>(total);
    }
    return freq;
}

static double entropy_from_counts(const CompositionCounts& counts) {
    if (counts.length == 0) return 0.0;
    const double len = static_cast<double>(counts.length);
    double entropy = 0.0;
    for (uint64_t n : counts.symbols) {
        if (n == 0) continue;
        const double p = static_cast<double>(n) / len;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

static double weight_from_counts(const CompositionCounts& counts, SequenceType type) {
    double weight = 0.0;
    for (char base : {'A', 'C', 'G', 'T', 'U'}) {
        weight += static_cast<double>(counts.count(base)) * monomer_weight(base, type);
    }
    if (counts.length > 1) {
        weight -= static_cast<double>(counts.length - 1) * WATER_LOSS_MASS;
    }
    return weight;
}

static double tm_from_counts(const CompositionCounts& counts) {
    const double at = static_cast<double>(counts.count('A') + counts.count('T') +
                                          counts.count('U'));
    const double gc = static_cast<double>(counts.count('G') + counts.count('C'));
    if (counts.length < TM_LONG_SEQUENCE) {
        return 2.0 * at + 4.0 * gc;
    }
    return 64.9 + 41.0 * (gc - 16.4) / static_cast<double>(counts.length);
}

static double gc_from_counts(const CompositionCounts& counts) {
    if (counts.length == 0) return 0.0;
    const double gc = static_cast<double>(counts.count('G') + counts.count('C'));
    return 100.0 * gc / static_cast<double>(counts.length);
}

CompositionStats stats_from_counts(const CompositionCounts& counts, SequenceType type) {
    CompositionStats stats;
    stats.length = static_cast<size_t>(counts.length);
    stats.gc_content = gc_from_counts(counts);
    for (size_t i = 0; i < counts.symbols.size(); ++i) {
        if (counts.symbols[i] > 0) {
            stats.nucleotide_counts[static_cast<char>(i)] =
                static_cast<size_t>(counts.symbols[i]);
        }
    }
    stats.molecular_weight = weight_from_counts(counts, type);
    stats.dinucleotide_frequencies = to_frequencies(counts.dinucleotides);
    stats.trinucleotide_frequencies = to_frequencies(counts.trinucleotides);
    stats.entropy = entropy_from_counts(counts);
    stats.melting_temperature = tm_from_counts(counts);
    return stats;
}

CompositionStats comprehensive_stats(const std::string& sequence, const Alphabet& alphabet) {
    const std::string seq = require_valid(sequence, alphabet);
    return stats_from_counts(count_composition(seq), alphabet.type);
}

CompositionStats comprehensive_stats_chunked(const std::string& sequence,
                                             const Alphabet& alphabet,
                                             size_t chunk_size,
                                             int num_threads) {
    if (chunk_size == 0) {
        throw InvalidParameterError("Chunk size must be >= 1");
    }
    const std::string seq = require_valid(sequence, alphabet);
    // Overflow-safe ceil(size / chunk_size)
    const size_t n_chunks = seq.size() / chunk_size + (seq.size() % chunk_size != 0 ? 1 : 0);
    std::vector<CompositionCounts> partial(n_chunks);

    int threads = num_threads;
#ifdef _OPENMP
    if (threads <= 0) {
        threads = omp_get_max_threads();
    }
#else
    threads = 1;
#endif

    // Chunks are independent; merge order does not matter for counts
    #pragma omp parallel for schedule(dynamic, 1) num_threads(threads)
    for (long c = 0; c < static_cast<long>(n_chunks); ++c) {
        const size_t begin = static_cast<size_t>(c) * chunk_size;
        partial[c] = count_composition(seq, begin, begin + chunk_size);
    }

    CompositionCounts total;
    for (const auto& counts : partial) {
        total.merge(counts);
    }
    return stats_from_counts(total, alphabet.type);
}

std::map<char, size_t> nucleotide_counts(const std::string& sequence) {
    std::map<char, size_t> counts;
    for (char c : sequence) {
        counts[fast_upper(c)]++;
    }
    return counts;
}

double gc_content(const std::string& sequence) {
    if (sequence.empty()) return 0.0;
    size_t gc = 0;
    for (char c : sequence) {
        const char u = fast_upper(c);
        if (u == 'G' || u == 'C') ++gc;
    }
    return 100.0 * static_cast<double>(gc) / static_cast<double>(sequence.size());
}

std::map<std::string, double> kmer_frequencies(const std::string& sequence, size_t k) {
    if (k == 0) {
        throw InvalidParameterError("k-mer size must be >= 1");
    }
    std::map<std::string, uint64_t> kmers;
    const std::string seq = normalize(sequence);
    for (size_t i = 0; i + k <= seq.size(); ++i) {
        kmers[seq.substr(i, k)]++;
    }
    return to_frequencies(kmers);
}

double shannon_entropy(const std::string& sequence) {
    return entropy_from_counts(count_composition(normalize(sequence)));
}

double molecular_weight(const std::string& sequence, SequenceType type) {
    return weight_from_counts(count_composition(normalize(sequence)), type);
}

double melting_temperature(const std::string& sequence) {
    return tm_from_counts(count_composition(normalize(sequence)));
}

std::vector<double> sliding_gc_content(const std::string& sequence,
                                       size_t window, size_t step) {
    if (window == 0 || step == 0) {
        throw InvalidParameterError("Window and step must be >= 1");
    }
    std::vector<double> profile;
    if (sequence.size() < window) return profile;

    // Running G+C count over the current window
    auto is_gc = [](char c) {
        const char u = fast_upper(c);
        return u == 'G' || u == 'C';
    };
    long long gc = 0;
    for (size_t i = 0; i < window; ++i) gc += is_gc(sequence[i]);

    size_t pos = 0;
    while (true) {
        profile.push_back(100.0 * static_cast<double>(gc) / static_cast<double>(window));
        if (pos + step + window > sequence.size()) break;
        for (size_t i = 0; i < step; ++i) {
            gc -= is_gc(sequence[pos + i]);
            gc += is_gc(sequence[pos + window + i]);
        }
        pos += step;
    }
    return profile;
}

} // namespace nucleo
