#include "nucleo/alphabet.hpp"
#include "nucleo/codon_tables.hpp"

#include <algorithm>
#include <array>

namespace nucleo {

std::string Alphabet::symbols() const {
    std::string out;
    switch (type) {
        case SequenceType::DNA: out = "ACGT"; break;
        case SequenceType::RNA: out = "ACGU"; break;
        case SequenceType::NUCLEIC: out = "ACGTU"; break;
    }
    if (allow_ambiguous) {
        out += IUPAC_AMBIGUITY_CODES;
    }
    return out;
}

bool Alphabet::contains(char c) const {
    const char u = fast_upper(c);
    switch (u) {
        case 'A': case 'C': case 'G':
            return true;
        case 'T':
            return type != SequenceType::RNA;
        case 'U':
            return type != SequenceType::DNA;
        case 'W': case 'S': case 'M': case 'K': case 'R': case 'Y':
        case 'B': case 'D': case 'H': case 'V': case 'N':
            return allow_ambiguous;
        default:
            return false;
    }
}

const char* sequence_type_name(SequenceType type) {
    switch (type) {
        case SequenceType::DNA: return "DNA";
        case SequenceType::RNA: return "RNA";
        case SequenceType::NUCLEIC: return "NUCLEIC";
    }
    return "UNKNOWN";
}

SequenceType parse_sequence_type(const std::string& tag) {
    const std::string t = normalize(tag);
    if (t == "DNA") return SequenceType::DNA;
    if (t == "RNA") return SequenceType::RNA;
    if (t == "NUCLEIC") return SequenceType::NUCLEIC;
    throw InvalidParameterError("Unsupported sequence type: " + tag +
                                ". Use 'dna', 'rna' or 'nucleic'.");
}

std::string normalize(const std::string& sequence) {
    std::string out(sequence);
    std::transform(out.begin(), out.end(), out.begin(), fast_upper);
    return out;
}

ValidationResult::ValidationResult(bool valid, ErrorKind kind, std::string message,
                                   std::vector<char> offending)
    : valid_(valid), kind_(kind), message_(std::move(message)),
      offending_(std::move(offending)) {}

ValidationResult ValidationResult::ok() {
    return ValidationResult(true, ErrorKind::InvalidParameter, "Sequence is valid", {});
}

ValidationResult ValidationResult::failure(ErrorKind kind, std::string message,
                                           std::vector<char> offending) {
    return ValidationResult(false, kind, std::move(message), std::move(offending));
}

void ValidationResult::throw_if_invalid() const {
    if (valid_) return;
    switch (kind_) {
        case ErrorKind::EmptySequence:
            throw EmptySequenceError(message_);
        case ErrorKind::InvalidSymbol:
            throw InvalidSymbolError(message_, offending_);
        case ErrorKind::LengthMismatch:
            throw LengthMismatchError(message_);
        case ErrorKind::InvalidParameter:
            throw InvalidParameterError(message_);
    }
    throw SequenceError(kind_, message_);
}

ValidationResult validate(const std::string& sequence, const Alphabet& alphabet) {
    if (sequence.empty()) {
        return ValidationResult::failure(ErrorKind::EmptySequence, "Empty sequence");
    }

    // Mark each offending byte once, then read them back in sorted order
    std::array<bool, 256> seen{};
    bool any_invalid = false;
    for (char c : sequence) {
        if (!alphabet.contains(c)) {
            seen[static_cast<unsigned char>(fast_upper(c))] = true;
            any_invalid = true;
        }
    }
    if (!any_invalid) {
        return ValidationResult::ok();
    }

    std::vector<char> offending;
    for (size_t i = 0; i < seen.size(); ++i) {
        if (seen[i]) offending.push_back(static_cast<char>(i));
    }

    std::string message = std::string("Invalid ") + sequence_type_name(alphabet.type) +
                          " bases found: ";
    for (size_t i = 0; i < offending.size(); ++i) {
        if (i > 0) message += ',';
        message += offending[i];
    }
    return ValidationResult::failure(ErrorKind::InvalidSymbol, std::move(message),
                                     std::move(offending));
}

std::string require_valid(const std::string& sequence, const Alphabet& alphabet) {
    validate(sequence, alphabet).throw_if_invalid();
    return normalize(sequence);
}

ValidationResult validate_pair(const std::string& first, const std::string& second,
                               const Alphabet& alphabet) {
    auto r1 = validate(first, alphabet);
    if (!r1) {
        return ValidationResult::failure(r1.error(), "First sequence: " + r1.message(),
                                         r1.offending());
    }
    auto r2 = validate(second, alphabet);
    if (!r2) {
        return ValidationResult::failure(r2.error(), "Second sequence: " + r2.message(),
                                         r2.offending());
    }
    return ValidationResult::ok();
}

ValidationResult validate_reading_frame(const std::string& sequence,
                                        const Alphabet& alphabet) {
    auto r = validate(sequence, alphabet);
    if (!r) return r;
    if (sequence.size() % 3 != 0) {
        return ValidationResult::failure(
            ErrorKind::InvalidParameter,
            "Sequence length must be divisible by 3 for reading frame analysis");
    }
    return r;
}

ValidationResult validate_length(const std::string& sequence,
                                 size_t min_length, size_t max_length) {
    const size_t len = sequence.size();
    if (min_length > 0 && len < min_length) {
        return ValidationResult::failure(
            ErrorKind::InvalidParameter,
            "Sequence length " + std::to_string(len) + " below minimum " +
            std::to_string(min_length));
    }
    if (max_length > 0 && len > max_length) {
        return ValidationResult::failure(
            ErrorKind::InvalidParameter,
            "Sequence length " + std::to_string(len) + " above maximum " +
            std::to_string(max_length));
    }
    return ValidationResult::ok();
}

} // namespace nucleo
