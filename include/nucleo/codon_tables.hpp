#pragma once

#include <array>
#include <string>

namespace nucleo {

/**
 * Fast inline character operations
 * Using lookup tables instead of branches/function calls
 */

// Fast uppercase
inline char fast_upper(char c) {
    // Uppercase offset: 'a'-'A' = 32
    return (c >= 'a' && c <= 'z') ? (c - 32) : c;
}

// Watson-Crick complement; any other symbol is returned unchanged
inline char fast_complement(char c) {
    switch (c) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'a': return 't';
        case 't': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        default: return c;
    }
}

// Base to codon-table index: T/U=0, C=1, A=2, G=3, anything else -1
inline int codon_base_idx(char c) {
    switch (fast_upper(c)) {
        case 'T': case 'U': return 0;
        case 'C': return 1;
        case 'A': return 2;
        case 'G': return 3;
        default: return -1;
    }
}

// Codon to table index (0-63), -1 if any base is not canonical
inline int codon_index(char c1, char c2, char c3) {
    int i1 = codon_base_idx(c1);
    int i2 = codon_base_idx(c2);
    int i3 = codon_base_idx(c3);
    if (i1 < 0 || i2 < 0 || i3 < 0) return -1;
    return i1 * 16 + i2 * 4 + i3;
}

// DNA start codon (ATG only)
inline bool is_start_codon(char c1, char c2, char c3) {
    return fast_upper(c1) == 'A' && fast_upper(c2) == 'T' && fast_upper(c3) == 'G';
}

// DNA stop codons TAA, TAG, TGA
inline bool is_stop_codon(char c1, char c2, char c3) {
    c1 = fast_upper(c1);
    c2 = fast_upper(c2);
    c3 = fast_upper(c3);
    return (c1 == 'T' && c2 == 'A' && (c3 == 'A' || c3 == 'G')) ||
           (c1 == 'T' && c2 == 'G' && c3 == 'A');
}

/**
 * Immutable codon -> amino acid table.
 *
 * Encoding: T/U=0, C=1, A=2, G=3
 * Index = base1*16 + base2*4 + base3
 *
 * Stop codons map to '*'. Codons containing a non-canonical base (IUPAC
 * ambiguity codes) are not in the table and translate to 'X'.
 */
class GeneticCode {
public:
    static constexpr char STOP = '*';
    static constexpr char UNKNOWN = 'X';

    explicit GeneticCode(const std::array<char, 64>& table) : table_(table) {}

    // NCBI translation table 1
    static const GeneticCode& standard();

    char translate(char c1, char c2, char c3) const {
        int idx = codon_index(c1, c2, c3);
        return idx < 0 ? UNKNOWN : table_[idx];
    }

    bool is_stop(char c1, char c2, char c3) const {
        return translate(c1, c2, c3) == STOP;
    }

    const std::array<char, 64>& table() const { return table_; }

private:
    std::array<char, 64> table_;
};

} // namespace nucleo
