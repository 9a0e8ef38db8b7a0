#pragma once

#include "nucleo/types.hpp"

#include <string>
#include <vector>

namespace nucleo {

// Default minimum ORF span in nucleotides (start codon through stop codon)
constexpr int DEFAULT_MIN_ORF_LENGTH = 30;

/**
 * Find open reading frames on the forward strand
 *
 * Each of the three frames is walked codon by codon. At every ATG the
 * scan continues in-frame until the first TAA/TAG/TGA; if the span from
 * the start codon through the end of the stop codon is at least
 * min_length nucleotides it is reported. The outer walk then resumes at
 * the codon after the start codon, so an ATG inside an earlier ORF starts
 * its own (nested) ORF. Start codons without an in-frame stop are dropped.
 *
 * @param sequence DNA sequence (validated, case-insensitive)
 * @param min_length Minimum ORF length in nucleotides (default: 30)
 * @param allow_ambiguous Accept IUPAC codes in the input
 * @return ORFs sorted by length (longest first), ties in discovery order
 *         (frame 0 first, then by start)
 *
 * Throws InvalidParameterError for a negative min_length.
 */
std::vector<OrfRecord> find_orfs(const std::string& sequence,
                                 int min_length = DEFAULT_MIN_ORF_LENGTH,
                                 bool allow_ambiguous = false);

} // namespace nucleo
