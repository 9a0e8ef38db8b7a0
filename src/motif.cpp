#include "nucleo/motif.hpp"

#include <algorithm>

namespace nucleo {

std::vector<Position> scan_motif(const std::string& sequence, const std::string& motif) {
    std::vector<Position> hits;
    if (motif.empty() || motif.size() > sequence.size()) return hits;

    size_t pos = sequence.find(motif);
    while (pos != std::string::npos) {
        hits.push_back(pos);
        pos = sequence.find(motif, pos + 1);
    }
    return hits;
}

std::vector<Position> find_motif(const std::string& sequence, const std::string& motif,
                                 const Alphabet& alphabet) {
    const std::string seq = require_valid(sequence, alphabet);
    const std::string pat = require_valid(motif, alphabet);
    return scan_motif(seq, pat);
}

namespace {

// Rows are window positions, columns are indexed by promoter_column()
constexpr Score TATA_BOX_PWM[PROMOTER_WINDOW][4] = {
    {0.8, 0.1, 0.05, 0.05},
    {0.9, 0.05, 0.02, 0.03},
    {0.1, 0.05, 0.05, 0.8},
    {0.9, 0.02, 0.05, 0.03},
};

inline int promoter_column(char base) {
    switch (base) {
        case 'T': return 0;
        case 'A': return 1;
        case 'G': return 2;
        case 'C': return 3;
        default:  return -1;
    }
}

} // namespace

std::vector<PromoterSite> predict_promoters(const std::string& sequence,
                                            const Alphabet& alphabet) {
    const std::string seq = require_valid(sequence, alphabet);

    std::vector<PromoterSite> sites;
    for (size_t i = 0; i + PROMOTER_WINDOW <= seq.size(); ++i) {
        Score score = 0.0;
        bool scored = true;
        for (size_t j = 0; j < PROMOTER_WINDOW; ++j) {
            const int col = promoter_column(seq[i + j]);
            if (col < 0) {
                scored = false;
                break;
            }
            score += TATA_BOX_PWM[j][col];
        }
        if (scored && score > PROMOTER_SCORE_THRESHOLD) {
            sites.push_back({i, score});
        }
    }

    std::stable_sort(sites.begin(), sites.end(),
                     [](const PromoterSite& a, const PromoterSite& b) {
                         return a.score > b.score;
                     });
    return sites;
}

RepeatMap find_repeats(const std::string& sequence, int min_length,
                       const Alphabet& alphabet) {
    if (min_length < 0) {
        throw InvalidParameterError("Minimum repeat length must be >= 0, got " +
                                    std::to_string(min_length));
    }
    const std::string seq = require_valid(sequence, alphabet);
    const size_t n = seq.size();
    const size_t max_len = n / 2;

    RepeatMap repeats;
    for (size_t len = std::max<size_t>(static_cast<size_t>(min_length), 1); len <= max_len; ++len) {
        for (size_t i = 0; i + len <= n; ++i) {
            std::string pattern = seq.substr(i, len);
            if (repeats.count(pattern)) continue;  // offsets already complete
            auto hits = scan_motif(seq, pattern);
            if (hits.size() > 1) {
                repeats.emplace(std::move(pattern), std::move(hits));
            }
        }
    }
    return repeats;
}

std::vector<TandemRepeat> find_tandem_repeats(const std::string& sequence,
                                              const Alphabet& alphabet) {
    const std::string seq = require_valid(sequence, alphabet);
    const size_t n = seq.size();
    const size_t unit_end = std::min(MAX_TANDEM_UNIT, n / 2);

    std::vector<TandemRepeat> repeats;
    for (size_t w = MIN_TANDEM_UNIT; w < unit_end; ++w) {
        for (size_t i = 0; i + 2 * w <= n; ++i) {
            size_t copies = 1;
            size_t next = i + w;
            while (next + w <= n && seq.compare(next, w, seq, i, w) == 0) {
                ++copies;
                next += w;
            }
            if (copies >= 2) {
                repeats.push_back({seq.substr(i, w), i, w, copies});
            }
        }
    }
    return repeats;
}

size_t hamming_distance(const std::string& first, const std::string& second,
                        const Alphabet& alphabet) {
    validate_pair(first, second, alphabet).throw_if_invalid();
    if (first.size() != second.size()) {
        throw LengthMismatchError("Sequences differ in length: " +
                                  std::to_string(first.size()) + " vs " +
                                  std::to_string(second.size()));
    }
    const std::string a = normalize(first);
    const std::string b = normalize(second);
    size_t distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) ++distance;
    }
    return distance;
}

} // namespace nucleo
