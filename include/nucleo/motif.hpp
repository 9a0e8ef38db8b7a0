#pragma once
// Exact motif search and repeat detection

#include "nucleo/alphabet.hpp"
#include "nucleo/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace nucleo {

// Default minimum pattern length for find_repeats
constexpr int DEFAULT_MIN_REPEAT_LENGTH = 2;

// Tandem unit sizes scanned by find_tandem_repeats: [MIN, MAX), further
// capped below len/2
constexpr size_t MIN_TANDEM_UNIT = 2;
constexpr size_t MAX_TANDEM_UNIT = 20;

/**
 * Start offsets of every occurrence of `motif` in `sequence`, overlapping
 * matches included (the window slides by one base). Both inputs must be
 * upper-case; nothing is validated.
 */
std::vector<Position> scan_motif(const std::string& sequence, const std::string& motif);

/**
 * Validated motif search. Both operands are validated against `alphabet`
 * independently and compared case-insensitively. Returns sorted 0-based
 * offsets; empty when the motif is longer than the sequence.
 */
std::vector<Position> find_motif(const std::string& sequence, const std::string& motif,
                                 const Alphabet& alphabet = {});

// Window width and minimum (exclusive) score for predict_promoters
constexpr size_t PROMOTER_WINDOW = 4;
constexpr Score PROMOTER_SCORE_THRESHOLD = 2.5;

/**
 * TATA-box promoter prediction.
 *
 * Every 4-base window is scored by summing one weight per position from a
 * fixed position weight matrix over A/C/G/T. Windows holding any other
 * symbol (IUPAC codes, U) are skipped. Sites scoring above
 * PROMOTER_SCORE_THRESHOLD are returned by descending score; equal scores
 * keep ascending start order.
 */
std::vector<PromoterSite> predict_promoters(const std::string& sequence,
                                            const Alphabet& alphabet = {});

/**
 * Exhaustive direct-repeat scan.
 *
 * Every substring of length min_length .. len/2 is looked up with
 * scan_motif; patterns occurring at least twice are kept with all of their
 * (possibly overlapping) offsets. Cubic in sequence length: bound the input
 * before calling on long sequences.
 *
 * Throws InvalidParameterError for a negative min_length.
 */
RepeatMap find_repeats(const std::string& sequence,
                       int min_length = DEFAULT_MIN_REPEAT_LENGTH,
                       const Alphabet& alphabet = {});

/**
 * Adjacent copies of a unit of w bases, MIN_TANDEM_UNIT <= w <
 * min(MAX_TANDEM_UNIT, len/2). One record per (start, unit) with at least two copies; `copies`
 * counts the whole run of consecutive copies from that start. Records are
 * ordered by unit length, then start.
 */
std::vector<TandemRepeat> find_tandem_repeats(const std::string& sequence,
                                              const Alphabet& alphabet = {});

// Number of mismatching positions; throws LengthMismatchError on unequal lengths
size_t hamming_distance(const std::string& first, const std::string& second,
                        const Alphabet& alphabet = {});

} // namespace nucleo
