#include "args.hpp"
#include "nucleo/version.h"
#include <iostream>
#include <string>

namespace nucleo {
namespace cli {

void print_version() {
    std::cout << "nucleo " << NUCLEO_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "nucleo v" << NUCLEO_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " (-i <input> | -s <sequence>) [options]\n\n";
    std::cout << "Input/output:\n";
    std::cout << "  -i, --input <file>       Input FASTA file (or .gz)\n";
    std::cout << "  -s, --sequence <seq>     Analyze a single sequence given inline\n";
    std::cout << "  -o, --output <file>      Output file (default: stdout)\n";
    std::cout << "  --format <fmt>           Output format: text (default), json or csv\n";
    std::cout << "  --fasta-out <file>       Write transformed sequences as FASTA (or .gz)\n";
    std::cout << "  --type <type>            Sequence type: dna (default), rna, nucleic\n";
    std::cout << "  --ambiguous              Accept IUPAC ambiguity codes\n";
    std::cout << "  --max-length <int>       Reject longer sequences (default: 10000000, 0 = off)\n";
    std::cout << "\nAnalyses (composition statistics are always reported):\n";
    std::cout << "  --orfs                   Find open reading frames\n";
    std::cout << "  --min-orf <int>          Minimum ORF length in nt (default: 30)\n";
    std::cout << "  --motif <seq>            Report every occurrence of a motif\n";
    std::cout << "  --repeats                Find direct repeats\n";
    std::cout << "  --min-repeat <int>       Minimum repeat length (default: 2)\n";
    std::cout << "  --tandem                 Find tandem repeats\n";
    std::cout << "  --promoters              Predict TATA-box promoter sites\n";
    std::cout << "  --revcomp                Report the reverse complement (dna only)\n";
    std::cout << "  --transcribe             Report the RNA transcript (dna only)\n";
    std::cout << "  --translate              Report the protein translation (dna or rna)\n";
    std::cout << "\nLocal alignment:\n";
    std::cout << "  --align-to <seq>         Align each input against this sequence\n";
    std::cout << "  --match <f>              Match score (default: 2)\n";
    std::cout << "  --mismatch <f>           Mismatch score (default: -1)\n";
    std::cout << "  --gap-open <f>           Gap open score (default: -10)\n";
    std::cout << "  --gap-extend <f>         Gap extend score (default: -0.5)\n";
    std::cout << "\nRuntime:\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    std::cout << "  --chunk-size <int>       Composition chunk size (default: 10000)\n";
    std::cout << "  --cache-size <int>       Memoization entries per operation (default: 128)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -i genes.fa.gz --orfs --min-orf 90\n";
    std::cout << "  " << program_name << " -s GATTACA --align-to GCATGCU --format json\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            try {
                if (!value.empty() && value[0] == '-') {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                size_t idx = 0;
                size_t parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_double = [&](const std::string& flag, const std::string& value) -> double {
            try {
                size_t idx = 0;
                double parsed = std::stod(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_file = require_value(arg);
        } else if (arg == "-s" || arg == "--sequence") {
            opts.sequence = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--fasta-out") {
            opts.fasta_output = require_value(arg);
        } else if (arg == "--format") {
            std::string fmt = require_value(arg);
            if (fmt == "text") {
                opts.format = OutputFormat::TEXT;
            } else if (fmt == "json") {
                opts.format = OutputFormat::JSON;
            } else if (fmt == "csv") {
                opts.format = OutputFormat::CSV;
            } else {
                throw ParseArgsExit(1, "Error: Unknown output format '" + fmt + "'");
            }
        } else if (arg == "--type") {
            opts.sequence_type = require_value(arg);
            if (opts.sequence_type != "dna" && opts.sequence_type != "rna" &&
                opts.sequence_type != "nucleic") {
                throw ParseArgsExit(1, "Error: Unknown sequence type '" + opts.sequence_type + "'");
            }
        } else if (arg == "--ambiguous") {
            opts.allow_ambiguous = true;
        } else if (arg == "--orfs") {
            opts.find_orfs = true;
        } else if (arg == "--min-orf") {
            opts.min_orf_length = parse_int(arg, require_value(arg));
            if (opts.min_orf_length < 0) {
                throw ParseArgsExit(1, "Error: --min-orf must be >= 0");
            }
            opts.find_orfs = true;
        } else if (arg == "--motif") {
            opts.motif = require_value(arg);
        } else if (arg == "--repeats") {
            opts.find_repeats = true;
        } else if (arg == "--min-repeat") {
            opts.min_repeat_length = parse_int(arg, require_value(arg));
            if (opts.min_repeat_length < 1) {
                throw ParseArgsExit(1, "Error: --min-repeat must be >= 1");
            }
            opts.find_repeats = true;
        } else if (arg == "--tandem") {
            opts.find_tandem = true;
        } else if (arg == "--promoters") {
            opts.find_promoters = true;
        } else if (arg == "--align-to") {
            opts.align_to = require_value(arg);
        } else if (arg == "--match") {
            opts.match_score = parse_double(arg, require_value(arg));
        } else if (arg == "--mismatch") {
            opts.mismatch_score = parse_double(arg, require_value(arg));
        } else if (arg == "--gap-open") {
            opts.gap_open = parse_double(arg, require_value(arg));
        } else if (arg == "--gap-extend") {
            opts.gap_extend = parse_double(arg, require_value(arg));
        } else if (arg == "--revcomp") {
            opts.reverse_complement = true;
        } else if (arg == "--transcribe") {
            opts.transcribe = true;
        } else if (arg == "--translate") {
            opts.translate = true;
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "--chunk-size") {
            opts.chunk_size = parse_size(arg, require_value(arg));
            if (opts.chunk_size < 1) {
                throw ParseArgsExit(1, "Error: --chunk-size must be >= 1");
            }
        } else if (arg == "--cache-size") {
            opts.cache_size = parse_size(arg, require_value(arg));
        } else if (arg == "--max-length") {
            opts.max_length = parse_size(arg, require_value(arg));
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.input_file.empty() && opts.sequence.empty()) {
        throw ParseArgsExit(1, "Error: No input specified (use -i or -s)");
    }
    if (!opts.input_file.empty() && !opts.sequence.empty()) {
        throw ParseArgsExit(1, "Error: -i and -s are mutually exclusive");
    }
    if ((opts.reverse_complement || opts.transcribe) && opts.sequence_type != "dna") {
        throw ParseArgsExit(1, "Error: --revcomp and --transcribe require --type dna");
    }
    if (opts.translate && opts.sequence_type == "nucleic") {
        throw ParseArgsExit(1, "Error: --translate requires --type dna or rna");
    }
    if (!opts.fasta_output.empty() &&
        !(opts.reverse_complement || opts.transcribe || opts.translate)) {
        throw ParseArgsExit(1, "Error: --fasta-out needs --revcomp, --transcribe or --translate");
    }

    return opts;
}

AnalysisConfig make_config(const Options& opts) {
    AnalysisConfig config;
    config.alphabet = Alphabet{parse_sequence_type(opts.sequence_type), opts.allow_ambiguous};
    config.alignment.match_score = opts.match_score;
    config.alignment.mismatch_score = opts.mismatch_score;
    config.alignment.gap_open = opts.gap_open;
    config.alignment.gap_extend = opts.gap_extend;
    config.min_orf_length = opts.min_orf_length;
    config.min_repeat_length = opts.min_repeat_length;
    config.cache_capacity = opts.cache_size;
    config.chunk_size = opts.chunk_size;
    config.num_threads = opts.num_threads;
    config.validate();
    return config;
}

}  // namespace cli
}  // namespace nucleo
