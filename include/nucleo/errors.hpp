#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nucleo {

// Failure categories shared by every operation
enum class ErrorKind {
    EmptySequence,     // Zero-length input where a sequence is required
    InvalidSymbol,     // Characters outside the resolved alphabet
    LengthMismatch,    // Paired operation on unequal-length inputs
    InvalidParameter   // Caller-supplied parameter out of its domain
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptySequence: return "EmptySequence";
        case ErrorKind::InvalidSymbol: return "InvalidSymbol";
        case ErrorKind::LengthMismatch: return "LengthMismatch";
        case ErrorKind::InvalidParameter: return "InvalidParameter";
    }
    return "Unknown";
}

/**
 * Base class for all sequence analysis errors.
 * Operations throw before computing anything, so a caught error never
 * comes with a partially filled result.
 */
class SequenceError : public std::runtime_error {
public:
    SequenceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class EmptySequenceError : public SequenceError {
public:
    explicit EmptySequenceError(const std::string& message = "Empty sequence")
        : SequenceError(ErrorKind::EmptySequence, message) {}
};

class InvalidSymbolError : public SequenceError {
public:
    InvalidSymbolError(const std::string& message, std::vector<char> offending)
        : SequenceError(ErrorKind::InvalidSymbol, message),
          offending_(std::move(offending)) {}

    // Sorted, deduplicated
    const std::vector<char>& offending() const noexcept { return offending_; }

private:
    std::vector<char> offending_;
};

class LengthMismatchError : public SequenceError {
public:
    explicit LengthMismatchError(const std::string& message)
        : SequenceError(ErrorKind::LengthMismatch, message) {}
};

class InvalidParameterError : public SequenceError {
public:
    explicit InvalidParameterError(const std::string& message)
        : SequenceError(ErrorKind::InvalidParameter, message) {}
};

} // namespace nucleo
