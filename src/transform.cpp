#include "nucleo/transform.hpp"
#include "nucleo/alphabet.hpp"

#include <algorithm>

namespace nucleo {

std::string complement(const std::string& dna, bool allow_ambiguous) {
    std::string out = require_valid(dna, Alphabet::dna(allow_ambiguous));
    std::transform(out.begin(), out.end(), out.begin(), fast_complement);
    return out;
}

std::string reverse_complement(const std::string& dna, bool allow_ambiguous) {
    const std::string seq = require_valid(dna, Alphabet::dna(allow_ambiguous));
    std::string rc;
    rc.reserve(seq.length());
    for (auto it = seq.rbegin(); it != seq.rend(); ++it) {
        rc += fast_complement(*it);
    }
    return rc;
}

std::string transcribe(const std::string& dna, bool allow_ambiguous) {
    std::string rna = require_valid(dna, Alphabet::dna(allow_ambiguous));
    std::replace(rna.begin(), rna.end(), 'T', 'U');
    return rna;
}

std::string translate(const std::string& rna, const GeneticCode& code,
                      bool allow_ambiguous) {
    const std::string seq = require_valid(rna, Alphabet::rna(allow_ambiguous));

    std::string protein;
    protein.reserve(seq.size() / 3);
    for (size_t i = 0; i + 3 <= seq.size(); i += 3) {
        const char aa = code.translate(seq[i], seq[i + 1], seq[i + 2]);
        if (aa == GeneticCode::STOP) break;
        protein += aa;
    }
    return protein;
}

} // namespace nucleo
