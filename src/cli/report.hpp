#ifndef NUCLEO_CLI_REPORT_HPP
#define NUCLEO_CLI_REPORT_HPP

#include "args.hpp"
#include "nucleo/analyzer.hpp"
#include "nucleo/errors.hpp"
#include "nucleo/sequence_io.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace nucleo {
namespace cli {

// Results for one input record. A failed record carries only its id,
// length and the error; analysis fields stay empty.
struct RecordReport {
    std::string id;
    size_t length = 0;

    bool ok = true;
    ErrorKind error_kind = ErrorKind::InvalidParameter;
    std::string error_message;

    std::optional<CompositionStats> stats;
    std::optional<std::vector<Position>> motif_positions;
    std::optional<RepeatMap> repeats;
    std::optional<std::vector<TandemRepeat>> tandem_repeats;
    std::optional<std::vector<OrfRecord>> orfs;
    std::optional<std::vector<PromoterSite>> promoters;
    std::optional<Score> alignment_score;
    std::optional<LocalAlignment> alignment;
    std::optional<std::string> reverse_complement;
    std::optional<std::string> transcript;
    std::optional<std::string> protein;
};

// Run every analysis requested in opts. SequenceError is caught and
// recorded in the report; other exceptions propagate.
RecordReport analyze_record(SequenceAnalyzer& analyzer, const Options& opts,
                            const SequenceRecord& record);

void write_text(std::ostream& os, const RecordReport& report);

// One JSON document holding every record
void write_json(std::ostream& os, const std::vector<RecordReport>& reports);

std::string json_escape(const std::string& str);

// CSV: one header line, then one row per record. List-valued results are
// reduced to counts, except motif positions (';'-separated).
void write_csv_header(std::ostream& os);
void write_csv_row(std::ostream& os, const RecordReport& report);
void write_csv(std::ostream& os, const std::vector<RecordReport>& reports);

// RFC 4180 quoting when the field holds a comma, quote or line break
std::string csv_escape(const std::string& field);

// Transformed sequences of a successful record as <id>_revcomp,
// <id>_transcript and <id>_protein. Returns the number of records written.
size_t write_fasta(FastaWriter& writer, const RecordReport& report);

}  // namespace cli
}  // namespace nucleo

#endif  // NUCLEO_CLI_REPORT_HPP
