// Unit tests for CLI argument parsing and per-record reports

#include "cli/args.hpp"
#include "cli/report.hpp"
#include "nucleo/sequence_io.hpp"
#include <cassert>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <vector>

class ArgvBuilder {
public:
    ArgvBuilder& add(const char* arg) {
        args_.push_back(strdup(arg));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

static void expect_parse_exit(int expected_code, ArgvBuilder& builder) {
    bool threw = false;
    try {
        (void)nucleo::cli::parse_args(builder.argc(), builder.argv());
    } catch (const nucleo::cli::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

void test_basic_args() {
    std::cout << "Testing basic args... ";
    ArgvBuilder builder;
    builder.add("nucleo").add("-i").add("input.fa").add("-o").add("report.txt");
    auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.input_file == "input.fa");
    assert(opts.output_file == "report.txt");
    assert(opts.sequence.empty());
    std::cout << "PASSED\n";
}

void test_defaults() {
    std::cout << "Testing defaults... ";
    ArgvBuilder builder;
    builder.add("nucleo").add("-s").add("ACGT");
    auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.sequence == "ACGT");
    assert(opts.output_file.empty());
    assert(opts.format == nucleo::cli::OutputFormat::TEXT);
    assert(opts.sequence_type == "dna");
    assert(opts.allow_ambiguous == false);
    assert(opts.find_orfs == false);
    assert(opts.min_orf_length == 30);
    assert(opts.min_repeat_length == 2);
    assert(opts.match_score == 2.0);
    assert(opts.mismatch_score == -1.0);
    assert(opts.gap_open == -10.0);
    assert(opts.gap_extend == -0.5);
    assert(opts.num_threads == 0);
    assert(opts.chunk_size == 10000);
    assert(opts.cache_size == 128);
    assert(opts.max_length == 10000000);
    std::cout << "PASSED\n";
}

void test_boolean_flags() {
    std::cout << "Testing boolean flags... ";
    ArgvBuilder builder;
    builder.add("nucleo")
           .add("-s").add("ACGT")
           .add("--ambiguous")
           .add("--orfs")
           .add("--repeats")
           .add("--tandem")
           .add("--promoters")
           .add("--revcomp")
           .add("--transcribe")
           .add("--translate")
           .add("--verbose");
    auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.allow_ambiguous);
    assert(opts.find_orfs);
    assert(opts.find_repeats);
    assert(opts.find_tandem);
    assert(opts.find_promoters);
    assert(opts.reverse_complement);
    assert(opts.transcribe);
    assert(opts.translate);
    assert(opts.verbose);
    std::cout << "PASSED\n";
}

void test_numeric_args() {
    std::cout << "Testing numeric args... ";
    ArgvBuilder builder;
    builder.add("nucleo")
           .add("-i").add("test.fa")
           .add("--min-orf").add("90")
           .add("--min-repeat").add("4")
           .add("--match").add("3")
           .add("--mismatch").add("-2.5")
           .add("--gap-open").add("-4")
           .add("--gap-extend").add("-1")
           .add("-t").add("8")
           .add("--chunk-size").add("500")
           .add("--cache-size").add("0")
           .add("--max-length").add("1000");
    auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.min_orf_length == 90);
    assert(opts.find_orfs);  // --min-orf implies --orfs
    assert(opts.min_repeat_length == 4);
    assert(opts.find_repeats);
    assert(opts.match_score == 3.0);
    assert(opts.mismatch_score == -2.5);
    assert(opts.gap_open == -4.0);
    assert(opts.gap_extend == -1.0);
    assert(opts.num_threads == 8);
    assert(opts.chunk_size == 500);
    assert(opts.cache_size == 0);
    assert(opts.max_length == 1000);
    std::cout << "PASSED\n";
}

void test_output_options() {
    std::cout << "Testing output options... ";
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--format").add("json")
               .add("--type").add("nucleic").add("--motif").add("AC").add("--align-to").add("ACGU");
        auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
        assert(opts.format == nucleo::cli::OutputFormat::JSON);
        assert(std::string(nucleo::cli::output_format_to_string(opts.format)) == "json");
        assert(opts.sequence_type == "nucleic");
        assert(opts.motif == "AC");
        assert(opts.align_to == "ACGU");
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-i").add("in.fa").add("--format").add("csv")
               .add("--translate").add("--fasta-out").add("proteins.fa.gz");
        auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
        assert(opts.format == nucleo::cli::OutputFormat::CSV);
        assert(std::string(nucleo::cli::output_format_to_string(opts.format)) == "csv");
        assert(opts.fasta_output == "proteins.fa.gz");
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--format").add("xml");
        expect_parse_exit(1, builder);
    }
    {
        // Nothing to write
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--fasta-out").add("out.fa");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--type").add("protein");
        expect_parse_exit(1, builder);
    }
    std::cout << "PASSED\n";
}

void test_validation_errors() {
    std::cout << "Testing validation errors... ";
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-i").add("test.fa").add("--threads").add("0");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-i").add("test.fa").add("--chunk-size").add("-2");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--min-orf").add("x");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--match").add("2.0abc");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--motif");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-i").add("test.fa").add("-s").add("ACGT");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("--bogus");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo");
        expect_parse_exit(1, builder);
    }
    std::cout << "PASSED\n";
}

void test_transform_type_combinations() {
    std::cout << "Testing transform/type combinations... ";
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("AUGC").add("--type").add("rna").add("--revcomp");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("AUGC").add("--type").add("rna").add("--transcribe");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGU").add("--type").add("nucleic").add("--translate");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("AUGAAA").add("--type").add("rna").add("--translate");
        auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
        nucleo::SequenceAnalyzer analyzer(nucleo::cli::make_config(opts));
        auto report = nucleo::cli::analyze_record(analyzer, opts, {"rna", "", "AUGAAA"});
        assert(report.ok);
        assert(report.stats.has_value());
        assert(report.protein && *report.protein == "MK");
    }
    std::cout << "PASSED\n";
}

void test_controlled_exits() {
    std::cout << "Testing help/version controlled exits... ";
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("--help");
        expect_parse_exit(0, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("--version");
        expect_parse_exit(0, builder);
    }
    std::cout << "PASSED\n";
}

void test_make_config() {
    std::cout << "Testing config from options... ";
    {
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGU").add("--type").add("rna").add("--ambiguous")
               .add("--gap-open").add("-3").add("--cache-size").add("7");
        auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
        auto config = nucleo::cli::make_config(opts);
        assert(config.alphabet.type == nucleo::SequenceType::RNA);
        assert(config.alphabet.allow_ambiguous);
        assert(config.alignment.gap_open == -3.0);
        assert(config.cache_capacity == 7);
    }
    {
        // Positive gap scores parse but are rejected by the configuration
        ArgvBuilder builder;
        builder.add("nucleo").add("-s").add("ACGT").add("--gap-extend").add("1");
        auto opts = nucleo::cli::parse_args(builder.argc(), builder.argv());
        bool threw = false;
        try {
            (void)nucleo::cli::make_config(opts);
        } catch (const nucleo::InvalidParameterError&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "PASSED\n";
}

void test_record_reports() {
    std::cout << "Testing record reports... ";
    nucleo::cli::Options opts;
    opts.find_orfs = true;
    opts.min_orf_length = 0;
    opts.find_promoters = true;
    opts.motif = "ATG";
    opts.translate = true;
    opts.align_to = "ATGAAA";
    opts.max_length = 20;

    nucleo::SequenceAnalyzer analyzer(nucleo::cli::make_config(opts));

    auto ok = nucleo::cli::analyze_record(analyzer, opts, {"good", "", "ATGAAATAGATGCCCTAA"});
    assert(ok.ok);
    assert(ok.stats && ok.stats->length == 18);
    assert(ok.orfs && ok.orfs->size() == 2);
    assert(ok.motif_positions && *ok.motif_positions == (std::vector<nucleo::Position>{0, 9}));
    assert(ok.protein && *ok.protein == "MK");
    assert(ok.promoters && ok.promoters->empty());
    assert(ok.alignment_score && *ok.alignment_score == 12.0);
    assert(!ok.repeats && !ok.reverse_complement);

    // Failure leaves no partial results behind
    auto bad = nucleo::cli::analyze_record(analyzer, opts, {"bad", "", "ATGXXX"});
    assert(!bad.ok);
    assert(bad.error_kind == nucleo::ErrorKind::InvalidSymbol);
    assert(bad.error_message == "Invalid DNA bases found: X");
    assert(!bad.stats && !bad.orfs && !bad.protein);

    auto too_long = nucleo::cli::analyze_record(analyzer, opts, {"long", "", std::string(21, 'A')});
    assert(!too_long.ok);
    assert(too_long.error_kind == nucleo::ErrorKind::InvalidParameter);

    auto empty = nucleo::cli::analyze_record(analyzer, opts, {"empty", "", ""});
    assert(!empty.ok);
    assert(empty.error_kind == nucleo::ErrorKind::EmptySequence);

    std::ostringstream text;
    nucleo::cli::write_text(text, bad);
    assert(text.str() == ">bad (6 nt)\n  Error [InvalidSymbol]: Invalid DNA bases found: X\n\n");

    std::ostringstream json;
    nucleo::cli::write_json(json, {ok, bad});
    const std::string doc = json.str();
    assert(doc.find("\"sequences\": 2") != std::string::npos);
    assert(doc.find("\"failed\": 1") != std::string::npos);
    assert(doc.find("\"protein\": \"MK\"") != std::string::npos);
    assert(doc.find("\"kind\": \"InvalidSymbol\"") != std::string::npos);

    assert(nucleo::cli::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
    std::cout << "PASSED\n";
}

void test_csv_report() {
    std::cout << "Testing CSV report... ";
    nucleo::cli::Options opts;
    opts.motif = "ATG";
    opts.find_orfs = true;
    opts.min_orf_length = 0;
    opts.translate = true;
    opts.align_to = "ATGAAA";

    nucleo::SequenceAnalyzer analyzer(nucleo::cli::make_config(opts));
    auto ok = nucleo::cli::analyze_record(analyzer, opts, {"good", "", "ATGAAATAGATGCCCTAA"});
    auto bad = nucleo::cli::analyze_record(analyzer, opts, {"bad", "", "ATGXXX"});

    std::ostringstream csv;
    nucleo::cli::write_csv(csv, {ok, bad});
    std::istringstream lines(csv.str());
    std::string header, good_row, bad_row, extra;
    std::getline(lines, header);
    std::getline(lines, good_row);
    std::getline(lines, bad_row);
    assert(!std::getline(lines, extra));

    assert(header.rfind("id,length,status,error_kind,error_message,gc_content,", 0) == 0);
    assert(header.size() > 8 && header.compare(header.size() - 8, 8, ",protein") == 0);

    assert(good_row.rfind("good,18,ok,,,", 0) == 0);
    assert(good_row.find(",0;9,") != std::string::npos);
    assert(good_row.find(",12.000000,") != std::string::npos);
    assert(good_row.compare(good_row.size() - 3, 3, ",MK") == 0);

    // Same column count for failed records
    auto columns = [](const std::string& row) {
        size_t n = 1;
        for (char c : row) n += (c == ',');
        return n;
    };
    assert(bad_row == "bad,6,error,InvalidSymbol,Invalid DNA bases found: X" +
                      std::string(columns(header) - 5, ','));
    assert(columns(good_row) == columns(header));

    assert(nucleo::cli::csv_escape("plain") == "plain");
    assert(nucleo::cli::csv_escape("X,Y") == "\"X,Y\"");
    assert(nucleo::cli::csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    std::cout << "PASSED\n";
}

void test_fasta_output() {
    std::cout << "Testing FASTA output of transforms... ";
    nucleo::cli::Options opts;
    opts.reverse_complement = true;
    opts.translate = true;

    nucleo::SequenceAnalyzer analyzer(nucleo::cli::make_config(opts));
    auto ok = nucleo::cli::analyze_record(analyzer, opts, {"g1", "", "ATGAAA"});
    auto bad = nucleo::cli::analyze_record(analyzer, opts, {"g2", "", "ATGXXX"});

    const std::string path = "nucleo_test_transforms.fa.gz";
    {
        nucleo::FastaWriter writer(path);
        assert(nucleo::cli::write_fasta(writer, ok) == 2);
        assert(nucleo::cli::write_fasta(writer, bad) == 0);
        writer.close();
    }

    nucleo::FastaReader reader(path);
    auto records = reader.read_all();
    assert(records.size() == 2);
    assert(records[0].id == "g1_revcomp" && records[0].sequence == "TTTCAT");
    assert(records[1].id == "g1_protein" && records[1].sequence == "MK");
    std::remove(path.c_str());
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Argument Parsing Tests ===\n\n";
    test_basic_args();
    test_defaults();
    test_boolean_flags();
    test_numeric_args();
    test_output_options();
    test_validation_errors();
    test_controlled_exits();
    test_make_config();
    test_record_reports();
    test_transform_type_combinations();
    test_csv_report();
    test_fasta_output();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
