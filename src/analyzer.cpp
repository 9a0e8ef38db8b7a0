#include "nucleo/analyzer.hpp"
#include "nucleo/transform.hpp"

namespace nucleo {

// boost::hash_combine mixing step
static inline void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t SequenceAnalyzer::PairHash::operator()(
    const std::pair<std::string, std::string>& key) const {
    size_t seed = std::hash<std::string>{}(key.first);
    hash_combine(seed, std::hash<std::string>{}(key.second));
    return seed;
}

size_t SequenceAnalyzer::AlignKeyHash::operator()(
    const std::tuple<std::string, std::string, bool>& key) const {
    size_t seed = std::hash<std::string>{}(std::get<0>(key));
    hash_combine(seed, std::hash<std::string>{}(std::get<1>(key)));
    hash_combine(seed, std::get<2>(key) ? 1u : 0u);
    return seed;
}

void AnalysisConfig::validate() const {
    alignment.validate();
    if (min_orf_length < 0) {
        throw InvalidParameterError("Minimum ORF length must be >= 0");
    }
    if (min_repeat_length < 0) {
        throw InvalidParameterError("Minimum repeat length must be >= 0");
    }
    if (chunk_size == 0) {
        throw InvalidParameterError("Chunk size must be >= 1");
    }
}

SequenceAnalyzer::SequenceAnalyzer(AnalysisConfig config)
    : config_(std::move(config)),
      stats_cache_(config_.cache_capacity),
      motif_cache_(config_.cache_capacity),
      repeat_cache_(config_.cache_capacity),
      align_cache_(config_.cache_capacity) {
    config_.validate();
}

ValidationResult SequenceAnalyzer::validate(const std::string& sequence) const {
    return nucleo::validate(sequence, config_.alphabet);
}

CompositionStats SequenceAnalyzer::statistics(const std::string& sequence) {
    if (auto cached = stats_cache_.get(sequence)) {
        return *cached;
    }
    CompositionStats stats = sequence.size() > config_.chunk_size
        ? comprehensive_stats_chunked(sequence, config_.alphabet,
                                      config_.chunk_size, config_.num_threads)
        : comprehensive_stats(sequence, config_.alphabet);
    stats_cache_.put(sequence, stats);
    return stats;
}

std::vector<Position> SequenceAnalyzer::find_motif(const std::string& sequence,
                                                   const std::string& motif) {
    auto key = std::make_pair(sequence, motif);
    if (auto cached = motif_cache_.get(key)) {
        return *cached;
    }
    auto hits = nucleo::find_motif(sequence, motif, config_.alphabet);
    motif_cache_.put(key, hits);
    return hits;
}

RepeatMap SequenceAnalyzer::find_repeats(const std::string& sequence) {
    if (auto cached = repeat_cache_.get(sequence)) {
        return *cached;
    }
    auto repeats = nucleo::find_repeats(sequence, config_.min_repeat_length, config_.alphabet);
    repeat_cache_.put(sequence, repeats);
    return repeats;
}

std::vector<TandemRepeat> SequenceAnalyzer::find_tandem_repeats(
    const std::string& sequence) const {
    return nucleo::find_tandem_repeats(sequence, config_.alphabet);
}

std::vector<OrfRecord> SequenceAnalyzer::find_orfs(const std::string& sequence) const {
    return nucleo::find_orfs(sequence, config_.min_orf_length,
                             config_.alphabet.allow_ambiguous);
}

std::vector<PromoterSite> SequenceAnalyzer::predict_promoters(
    const std::string& sequence) const {
    return nucleo::predict_promoters(sequence, config_.alphabet);
}

AlignmentResult SequenceAnalyzer::align(const std::string& seq1, const std::string& seq2,
                                        bool traceback) {
    auto key = std::make_tuple(seq1, seq2, traceback);
    if (auto cached = align_cache_.get(key)) {
        return *cached;
    }
    auto result = local_align(seq1, seq2, config_.alignment, traceback,
                              Alphabet::nucleic(config_.alphabet.allow_ambiguous));
    align_cache_.put(key, result);
    return result;
}

std::string SequenceAnalyzer::reverse_complement(const std::string& sequence) const {
    return nucleo::reverse_complement(sequence, config_.alphabet.allow_ambiguous);
}

std::string SequenceAnalyzer::transcribe(const std::string& sequence) const {
    return nucleo::transcribe(sequence, config_.alphabet.allow_ambiguous);
}

std::string SequenceAnalyzer::translate(const std::string& sequence) const {
    return nucleo::translate(sequence, GeneticCode::standard(),
                             config_.alphabet.allow_ambiguous);
}

CacheCounters SequenceAnalyzer::cache_counters() const {
    CacheCounters c;
    c.hits = stats_cache_.hits() + motif_cache_.hits() +
             repeat_cache_.hits() + align_cache_.hits();
    c.misses = stats_cache_.misses() + motif_cache_.misses() +
               repeat_cache_.misses() + align_cache_.misses();
    c.entries = stats_cache_.size() + motif_cache_.size() +
                repeat_cache_.size() + align_cache_.size();
    return c;
}

void SequenceAnalyzer::clear_caches() {
    stats_cache_.clear();
    motif_cache_.clear();
    repeat_cache_.clear();
    align_cache_.clear();
}

} // namespace nucleo
