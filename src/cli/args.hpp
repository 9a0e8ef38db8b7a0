#ifndef NUCLEO_CLI_ARGS_HPP
#define NUCLEO_CLI_ARGS_HPP

#include "nucleo/analyzer.hpp"

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace nucleo {
namespace cli {

enum class OutputFormat {
    TEXT,
    JSON,
    CSV
};

struct Options {
    std::string input_file;            // FASTA (or .gz)
    std::string sequence;              // Inline sequence instead of a file
    std::string output_file;           // Empty = stdout
    std::string fasta_output;          // Transformed sequences as FASTA (or .gz)
    OutputFormat format = OutputFormat::TEXT;
    std::string sequence_type = "dna";
    bool allow_ambiguous = false;

    bool find_orfs = false;
    int min_orf_length = 30;
    std::string motif;
    bool find_repeats = false;
    int min_repeat_length = 2;
    bool find_tandem = false;
    bool find_promoters = false;

    std::string align_to;              // Second sequence for local alignment
    double match_score = 2.0;
    double mismatch_score = -1.0;
    double gap_open = -10.0;
    double gap_extend = -0.5;

    bool reverse_complement = false;
    bool transcribe = false;
    bool translate = false;

    int num_threads = 0;
    size_t chunk_size = 10000;
    size_t cache_size = 128;
    size_t max_length = 10000000;      // Safety check on input length (0 = off)
    bool verbose = false;
};

// Thrown instead of calling exit(): 0 for --help/--version, 1 for errors
class ParseArgsExit : public std::exception {
public:
    explicit ParseArgsExit(int exit_code, std::string message = "")
        : exit_code_(exit_code), message_(std::move(message)) {}

    int exit_code() const noexcept { return exit_code_; }
    const std::string& message() const noexcept { return message_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int exit_code_;
    std::string message_;
};

inline const char* output_format_to_string(OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::JSON: return "json";
        case OutputFormat::CSV: return "csv";
        default: return "text";
    }
}

// Print version string to stdout
void print_version();

// Print usage/help to stdout
void print_usage(const char* program_name);

// Parse command-line arguments into Options struct
// Throws ParseArgsExit(0) for --help/--version
// Throws ParseArgsExit(1) for errors (missing input, unknown options, bad values)
Options parse_args(int argc, char* argv[]);

// Immutable analysis configuration from parsed options
// Throws InvalidParameterError for out-of-domain values
AnalysisConfig make_config(const Options& opts);

}  // namespace cli
}  // namespace nucleo

#endif  // NUCLEO_CLI_ARGS_HPP
