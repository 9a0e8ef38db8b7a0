#pragma once
// Caller-owned analysis facade
//
// Holds one immutable AnalysisConfig and a bounded LRU cache per memoized
// operation. Cached and uncached calls return identical values; the cache
// only saves recomputation of repeated queries.

#include "nucleo/alignment.hpp"
#include "nucleo/alphabet.hpp"
#include "nucleo/composition.hpp"
#include "nucleo/lru_cache.hpp"
#include "nucleo/motif.hpp"
#include "nucleo/orf_finder.hpp"
#include "nucleo/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace nucleo {

struct AnalysisConfig {
    Alphabet alphabet;                    // DNA, strict
    AlignmentParams alignment;
    int min_orf_length = DEFAULT_MIN_ORF_LENGTH;
    int min_repeat_length = DEFAULT_MIN_REPEAT_LENGTH;
    size_t cache_capacity = 128;          // Entries per operation cache (0 = off)
    size_t chunk_size = 10000;            // Composition chunk size
    int num_threads = 0;                  // 0 = all cores

    // Throws InvalidParameterError
    void validate() const;
};

struct CacheCounters {
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t entries = 0;
};

class SequenceAnalyzer {
public:
    explicit SequenceAnalyzer(AnalysisConfig config = {});

    const AnalysisConfig& config() const { return config_; }

    ValidationResult validate(const std::string& sequence) const;

    // Chunk-parallel above config.chunk_size, single pass otherwise
    CompositionStats statistics(const std::string& sequence);

    std::vector<Position> find_motif(const std::string& sequence, const std::string& motif);
    RepeatMap find_repeats(const std::string& sequence);
    std::vector<TandemRepeat> find_tandem_repeats(const std::string& sequence) const;
    std::vector<OrfRecord> find_orfs(const std::string& sequence) const;
    std::vector<PromoterSite> predict_promoters(const std::string& sequence) const;

    // seq1/seq2 are validated as DNA or RNA symbols (see local_align)
    AlignmentResult align(const std::string& seq1, const std::string& seq2,
                          bool traceback = true);

    std::string reverse_complement(const std::string& sequence) const;
    std::string transcribe(const std::string& sequence) const;
    std::string translate(const std::string& sequence) const;

    // Totals over all operation caches
    CacheCounters cache_counters() const;
    void clear_caches();

private:
    struct PairHash {
        size_t operator()(const std::pair<std::string, std::string>& key) const;
    };
    struct AlignKeyHash {
        size_t operator()(const std::tuple<std::string, std::string, bool>& key) const;
    };

    AnalysisConfig config_;
    LruCache<std::string, CompositionStats> stats_cache_;
    LruCache<std::pair<std::string, std::string>, std::vector<Position>, PairHash> motif_cache_;
    LruCache<std::string, RepeatMap> repeat_cache_;
    LruCache<std::tuple<std::string, std::string, bool>, AlignmentResult, AlignKeyHash> align_cache_;
};

} // namespace nucleo
