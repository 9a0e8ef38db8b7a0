#include "nucleo/orf_finder.hpp"
#include "nucleo/alphabet.hpp"
#include "nucleo/codon_tables.hpp"

#include <algorithm>

namespace nucleo {

std::vector<OrfRecord> find_orfs(const std::string& sequence, int min_length,
                                 bool allow_ambiguous) {
    if (min_length < 0) {
        throw InvalidParameterError("Minimum ORF length must be >= 0, got " +
                                    std::to_string(min_length));
    }
    const std::string seq = require_valid(sequence, Alphabet::dna(allow_ambiguous));
    const size_t n = seq.size();
    const size_t min_len = static_cast<size_t>(min_length);

    std::vector<OrfRecord> orfs;
    for (int frame = 0; frame < 3; ++frame) {
        for (size_t i = static_cast<size_t>(frame); i + 3 <= n; i += 3) {
            if (!is_start_codon(seq[i], seq[i + 1], seq[i + 2])) continue;

            for (size_t j = i + 3; j + 3 <= n; j += 3) {
                if (is_stop_codon(seq[j], seq[j + 1], seq[j + 2])) {
                    if (j + 3 - i >= min_len) {
                        orfs.push_back({i, seq.substr(i, j + 3 - i), frame});
                    }
                    break;
                }
            }
        }
    }

    std::stable_sort(orfs.begin(), orfs.end(),
                     [](const OrfRecord& a, const OrfRecord& b) {
                         return a.length() > b.length();
                     });
    return orfs;
}

} // namespace nucleo
