#pragma once

#include "nucleo/codon_tables.hpp"

#include <string>

namespace nucleo {

/**
 * Canonical sequence transformations. Each validates its input first and
 * returns upper-case output.
 */

// A<->T, G<->C without reversal; IUPAC codes pass through when allowed
std::string complement(const std::string& dna, bool allow_ambiguous = false);

// Reverse complement of a DNA sequence
std::string reverse_complement(const std::string& dna, bool allow_ambiguous = false);

// DNA -> RNA: every T becomes U
std::string transcribe(const std::string& dna, bool allow_ambiguous = false);

/**
 * RNA -> protein.
 * Non-overlapping codons from offset 0; translation stops (without a
 * residue) at the first stop codon; codons with ambiguity codes give 'X';
 * a trailing partial codon is dropped.
 */
std::string translate(const std::string& rna,
                      const GeneticCode& code = GeneticCode::standard(),
                      bool allow_ambiguous = false);

} // namespace nucleo
