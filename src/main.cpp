// Main entry point for the nucleo command-line front end
//
// Usage:
//   nucleo -i genes.fa.gz --orfs            Analyze every record of a FASTA file
//   nucleo -s GATTACA --align-to GCATGCU    Analyze one inline sequence

#include "cli/args.hpp"
#include "cli/report.hpp"
#include "nucleo/errors.hpp"
#include "nucleo/log_utils.hpp"
#include "nucleo/sequence_io.hpp"
#include "nucleo/version.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace nucleo;

int main(int argc, char* argv[]) {
    cli::Options opts;
    try {
        opts = cli::parse_args(argc, argv);
    } catch (const cli::ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            if (e.exit_code() != 0) {
                std::cerr << "Run '" << argv[0] << " --help' for usage information.\n";
            }
        }
        return e.exit_code();
    }

    log_utils::set_verbose(opts.verbose);
    auto start_time = std::chrono::steady_clock::now();

    try {
        AnalysisConfig config = cli::make_config(opts);

        int num_threads = config.num_threads;
#ifdef _OPENMP
        if (num_threads == 0) {
            num_threads = omp_get_max_threads();
        }
#else
        num_threads = 1;
#endif

        std::cerr << "nucleo v" << NUCLEO_VERSION << "\n";
        std::cerr << "Input: " << (opts.input_file.empty() ? "<inline sequence>" : opts.input_file) << "\n";
        std::cerr << "Output: " << (opts.output_file.empty() ? "<stdout>" : opts.output_file) << "\n";
        if (!opts.fasta_output.empty()) {
            std::cerr << "FASTA output: " << opts.fasta_output << "\n";
        }
        std::cerr << "Type: " << sequence_type_name(config.alphabet.type)
                  << (config.alphabet.allow_ambiguous ? " (IUPAC codes allowed)" : "") << "\n";
        std::cerr << "Threads: " << num_threads << "\n";

        if (opts.verbose) {
            std::cerr << "Format: " << cli::output_format_to_string(opts.format) << "\n";
            std::cerr << "Chunk size: " << config.chunk_size << "\n";
            std::cerr << "Cache size: " << config.cache_capacity << " entries per operation\n";
            if (!opts.align_to.empty()) {
                std::cerr << "Scoring: match " << config.alignment.match_score
                          << ", mismatch " << config.alignment.mismatch_score
                          << ", gap open " << config.alignment.gap_open
                          << ", gap extend " << config.alignment.gap_extend << "\n";
            }
        }
        std::cerr << "\n";

        SequenceAnalyzer analyzer(config);

        std::ofstream out_file;
        if (!opts.output_file.empty()) {
            out_file.open(opts.output_file);
            if (!out_file) {
                std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
                return 1;
            }
        }
        std::ostream& out = opts.output_file.empty() ? std::cout : out_file;

        std::unique_ptr<FastaWriter> fasta_writer;
        if (!opts.fasta_output.empty()) {
            fasta_writer = std::make_unique<FastaWriter>(opts.fasta_output);
        }
        size_t fasta_written = 0;

        if (opts.format == cli::OutputFormat::CSV) {
            cli::write_csv_header(out);
        }

        std::vector<cli::RecordReport> reports;
        size_t failed = 0;

        auto process = [&](const SequenceRecord& record) {
            cli::RecordReport report = cli::analyze_record(analyzer, opts, record);
            if (!report.ok) {
                ++failed;
                log_utils::debug(record.id + ": " + report.error_message);
            }
            if (fasta_writer) {
                fasta_written += cli::write_fasta(*fasta_writer, report);
            }
            if (opts.format == cli::OutputFormat::TEXT) {
                cli::write_text(out, report);
            } else if (opts.format == cli::OutputFormat::CSV) {
                cli::write_csv_row(out, report);
            } else {
                reports.push_back(std::move(report));
            }
        };

        size_t seq_count = 0;
        if (!opts.sequence.empty()) {
            SequenceRecord record;
            record.id = "input_sequence";
            record.sequence = opts.sequence;
            process(record);
            seq_count = 1;
        } else {
            FastaReader reader(opts.input_file);
            reader.for_each([&](const SequenceRecord& record) {
                process(record);
                ++seq_count;
            });
        }

        if (opts.format == cli::OutputFormat::JSON) {
            cli::write_json(out, reports);
        }
        out.flush();
        if (fasta_writer) {
            fasta_writer->close();
            log_utils::info("Wrote " + std::to_string(fasta_written) + " sequences to " +
                            opts.fasta_output);
        }

        auto end_time = std::chrono::steady_clock::now();
        log_utils::info("Sequences: " + std::to_string(seq_count) + " (" +
                        std::to_string(failed) + " failed)");
        if (opts.verbose) {
            CacheCounters counters = analyzer.cache_counters();
            log_utils::debug("Cache: " + std::to_string(counters.hits) + " hits, " +
                             std::to_string(counters.misses) + " misses, " +
                             std::to_string(counters.entries) + " entries");
        }
        std::cerr << "Elapsed: " << log_utils::format_elapsed(start_time, end_time) << "\n";

        if (failed > 0) {
            log_utils::warn(std::to_string(failed) + " record(s) failed validation");
            return 1;
        }
        return 0;

    } catch (const SequenceError& e) {
        std::cerr << "Error [" << error_kind_name(e.kind()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        log_utils::error(e.what());
        return 1;
    }
}
