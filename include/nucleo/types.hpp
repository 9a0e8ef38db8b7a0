#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nucleo {

// Basic sequence types
using Position = size_t;
using Score = double;

// Sequence type tag used to resolve the allowed alphabet
enum class SequenceType : uint8_t {
    DNA = 0,
    RNA = 1,
    NUCLEIC = 2  // DNA and RNA symbols together (alignment inputs)
};

// Open reading frame record
struct OrfRecord {
    Position start = 0;      // Offset of the start codon (0-based)
    std::string sequence;    // Start codon through the inclusive stop codon
    int frame = 0;           // Reading frame (0, 1, or 2)

    size_t length() const { return sequence.size(); }
    Position end() const { return start + sequence.size(); }  // exclusive
};

// Repeated pattern -> sorted start offsets (only patterns seen >= 2 times)
using RepeatMap = std::map<std::string, std::vector<Position>>;

// Immediately adjacent copies of one pattern
struct TandemRepeat {
    std::string pattern;
    Position start = 0;
    size_t length = 0;   // Unit length (pattern size)
    size_t copies = 0;   // Consecutive copies from start, always >= 2

    Position end() const { return start + length * copies; }  // exclusive
};

// Candidate TATA-box window scored against the promoter weight matrix
struct PromoterSite {
    Position start = 0;   // Offset of the 4-base window
    Score score = 0.0;
};

} // namespace nucleo
