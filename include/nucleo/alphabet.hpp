#pragma once

#include "nucleo/errors.hpp"
#include "nucleo/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace nucleo {

/**
 * Allowed symbol set for a sequence.
 *
 *   DNA strict      A C G T
 *   RNA strict      A C G U
 *   NUCLEIC strict  A C G T U
 *
 * With allow_ambiguous the IUPAC codes W S M K R Y B D H V N are added.
 * Symbols are compared in upper case.
 */
struct Alphabet {
    SequenceType type = SequenceType::DNA;
    bool allow_ambiguous = false;

    static Alphabet dna(bool allow_ambiguous = false) {
        return {SequenceType::DNA, allow_ambiguous};
    }
    static Alphabet rna(bool allow_ambiguous = false) {
        return {SequenceType::RNA, allow_ambiguous};
    }
    static Alphabet nucleic(bool allow_ambiguous = false) {
        return {SequenceType::NUCLEIC, allow_ambiguous};
    }

    // Upper-case symbols, in a fixed order
    std::string symbols() const;
    bool contains(char c) const;
};

// IUPAC ambiguity codes shared by the DNA and RNA alphabets
inline constexpr const char* IUPAC_AMBIGUITY_CODES = "WSMKRYBDHVN";

const char* sequence_type_name(SequenceType type);

// Parse "dna", "rna" or "nucleic" (case-insensitive); throws InvalidParameterError
SequenceType parse_sequence_type(const std::string& tag);

// Upper-case canonical form
std::string normalize(const std::string& sequence);

/**
 * Verdict of a validation run. Built once through ok()/failure() and
 * read-only afterwards.
 */
class ValidationResult {
public:
    static ValidationResult ok();
    static ValidationResult failure(ErrorKind kind, std::string message,
                                    std::vector<char> offending = {});

    bool is_valid() const noexcept { return valid_; }
    explicit operator bool() const noexcept { return valid_; }

    // Meaningful only when !is_valid()
    ErrorKind error() const noexcept { return kind_; }
    const std::vector<char>& offending() const noexcept { return offending_; }
    const std::string& message() const noexcept { return message_; }

    // Rethrow the failure as the matching SequenceError subclass; no-op when valid
    void throw_if_invalid() const;

private:
    ValidationResult(bool valid, ErrorKind kind, std::string message,
                     std::vector<char> offending);

    bool valid_;
    ErrorKind kind_;
    std::string message_;
    std::vector<char> offending_;
};

/**
 * Check every symbol of a sequence against an alphabet.
 * Fails on empty input or on any symbol outside the alphabet, in which case
 * all offending symbols are reported at once (upper-cased, sorted, unique).
 * Pure: never throws, never logs.
 */
ValidationResult validate(const std::string& sequence, const Alphabet& alphabet = {});

inline ValidationResult validate(const std::string& sequence, SequenceType type,
                                 bool allow_ambiguous) {
    return validate(sequence, Alphabet{type, allow_ambiguous});
}

// Validate and return the upper-case form; throws the matching SequenceError
std::string require_valid(const std::string& sequence, const Alphabet& alphabet = {});

// Both sequences must pass; the message names the one that failed
ValidationResult validate_pair(const std::string& first, const std::string& second,
                               const Alphabet& alphabet = {});

// Valid sequence whose length is a multiple of 3
ValidationResult validate_reading_frame(const std::string& sequence,
                                        const Alphabet& alphabet = {});

// Length bounds check only (0 = unbounded)
ValidationResult validate_length(const std::string& sequence,
                                 size_t min_length, size_t max_length);

} // namespace nucleo
