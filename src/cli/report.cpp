#include "report.hpp"
#include "nucleo/version.h"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace nucleo {
namespace cli {

RecordReport analyze_record(SequenceAnalyzer& analyzer, const Options& opts,
                            const SequenceRecord& record) {
    RecordReport report;
    report.id = record.id;
    report.length = record.sequence.size();

    const std::string& seq = record.sequence;
    try {
        validate_length(seq, 0, opts.max_length).throw_if_invalid();

        report.stats = analyzer.statistics(seq);
        if (!opts.motif.empty()) {
            report.motif_positions = analyzer.find_motif(seq, opts.motif);
        }
        if (opts.find_repeats) {
            report.repeats = analyzer.find_repeats(seq);
        }
        if (opts.find_tandem) {
            report.tandem_repeats = analyzer.find_tandem_repeats(seq);
        }
        if (opts.find_orfs) {
            report.orfs = analyzer.find_orfs(seq);
        }
        if (opts.find_promoters) {
            report.promoters = analyzer.predict_promoters(seq);
        }
        if (!opts.align_to.empty()) {
            AlignmentResult aln = analyzer.align(seq, opts.align_to);
            report.alignment_score = aln.score;
            report.alignment = aln.alignment;
        }
        if (opts.reverse_complement) {
            report.reverse_complement = analyzer.reverse_complement(seq);
        }
        if (opts.transcribe) {
            report.transcript = analyzer.transcribe(seq);
        }
        if (opts.translate) {
            // DNA input goes through transcription first
            if (analyzer.config().alphabet.type == SequenceType::RNA) {
                report.protein = analyzer.translate(seq);
            } else {
                report.protein = analyzer.translate(analyzer.transcribe(seq));
            }
        }
    } catch (const SequenceError& e) {
        RecordReport failed;
        failed.id = report.id;
        failed.length = report.length;
        failed.ok = false;
        failed.error_kind = e.kind();
        failed.error_message = e.what();
        return failed;
    }
    return report;
}

namespace {

template <typename T>
std::string join(const std::vector<T>& values, const char* sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << sep;
        oss << values[i];
    }
    return oss.str();
}

std::string format_frequencies(const std::map<std::string, double>& freqs) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    bool first = true;
    for (const auto& [kmer, freq] : freqs) {
        if (!first) oss << " ";
        oss << kmer << "=" << freq;
        first = false;
    }
    return oss.str();
}

}  // namespace

void write_text(std::ostream& os, const RecordReport& report) {
    os << ">" << report.id << " (" << report.length << " nt)\n";
    if (!report.ok) {
        os << "  Error [" << error_kind_name(report.error_kind) << "]: "
           << report.error_message << "\n\n";
        return;
    }

    if (report.stats) {
        const CompositionStats& s = *report.stats;
        os << std::fixed << std::setprecision(2);
        os << "  GC content:          " << s.gc_content << "%\n";
        os << "  Molecular weight:    " << s.molecular_weight << " Da\n";
        os << std::setprecision(4);
        os << "  Entropy:             " << s.entropy << " bits\n";
        os << std::setprecision(2);
        os << "  Melting temperature: " << s.melting_temperature << " C\n";
        os << "  Nucleotides:        ";
        for (const auto& [base, count] : s.nucleotide_counts) {
            os << " " << base << "=" << count;
        }
        os << "\n";
        os << "  Dinucleotides:       " << format_frequencies(s.dinucleotide_frequencies) << "\n";
    }

    if (report.motif_positions) {
        os << "  Motif hits:          " << report.motif_positions->size();
        if (!report.motif_positions->empty()) {
            os << " at " << join(*report.motif_positions, ",");
        }
        os << "\n";
    }

    if (report.repeats) {
        os << "  Repeats:             " << report.repeats->size() << " patterns\n";
        for (const auto& [pattern, positions] : *report.repeats) {
            os << "    " << pattern << "\t" << join(positions, ",") << "\n";
        }
    }

    if (report.tandem_repeats) {
        os << "  Tandem repeats:      " << report.tandem_repeats->size() << "\n";
        for (const auto& tr : *report.tandem_repeats) {
            os << "    " << tr.pattern << " x" << tr.copies
               << "\t[" << tr.start << ", " << tr.end() << ")\n";
        }
    }

    if (report.orfs) {
        os << "  ORFs:                " << report.orfs->size() << "\n";
        for (const auto& orf : *report.orfs) {
            os << "    frame " << orf.frame << "\t[" << orf.start << ", " << orf.end()
               << ")\t" << orf.length() << " nt\t" << orf.sequence << "\n";
        }
    }

    if (report.promoters) {
        os << "  Promoter sites:      " << report.promoters->size() << "\n";
        os << std::setprecision(2);
        for (const auto& site : *report.promoters) {
            os << "    " << site.start << "\t" << site.score << "\n";
        }
    }

    if (report.alignment_score) {
        os << std::setprecision(2);
        os << "  Alignment score:     " << *report.alignment_score << "\n";
        if (report.alignment && report.alignment->length() > 0) {
            const LocalAlignment& aln = *report.alignment;
            os << "  Alignment identity:  " << aln.identity() * 100.0 << "% ("
               << aln.matches << "/" << aln.length() << ")\n";
            os << "  Query span:          [" << aln.start1 << ", " << aln.end1 << ")\n";
            os << "  Target span:         [" << aln.start2 << ", " << aln.end2 << ")\n";
            std::istringstream lines(to_string(aln));
            std::string line;
            while (std::getline(lines, line)) {
                os << "    " << line << "\n";
            }
        }
    }

    if (report.reverse_complement) {
        os << "  Reverse complement:  " << *report.reverse_complement << "\n";
    }
    if (report.transcript) {
        os << "  Transcript:          " << *report.transcript << "\n";
    }
    if (report.protein) {
        os << "  Protein:             " << *report.protein << "\n";
    }
    os << "\n";
}

std::string json_escape(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

namespace {

std::string quoted(const std::string& str) {
    return "\"" + json_escape(str) + "\"";
}

std::string json_frequencies(const std::map<std::string, double>& freqs) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << "{";
    bool first = true;
    for (const auto& [kmer, freq] : freqs) {
        if (!first) oss << ", ";
        oss << quoted(kmer) << ": " << freq;
        first = false;
    }
    oss << "}";
    return oss.str();
}

std::string json_positions(const std::vector<Position>& positions) {
    return "[" + join(positions, ", ") + "]";
}

// Fields are collected first so commas land only between entries
void write_record_json(std::ostream& os, const RecordReport& r) {
    std::vector<std::string> fields;
    const std::string ind = "      ";

    fields.push_back("\"id\": " + quoted(r.id));
    fields.push_back("\"length\": " + std::to_string(r.length));
    fields.push_back(std::string("\"status\": ") + (r.ok ? "\"ok\"" : "\"error\""));

    if (!r.ok) {
        fields.push_back("\"error\": {\"kind\": " + quoted(error_kind_name(r.error_kind)) +
                         ", \"message\": " + quoted(r.error_message) + "}");
    }

    if (r.stats) {
        const CompositionStats& s = *r.stats;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6);
        oss << "\"statistics\": {\n";
        oss << ind << "  \"gc_content\": " << s.gc_content << ",\n";
        oss << ind << "  \"molecular_weight\": " << s.molecular_weight << ",\n";
        oss << ind << "  \"entropy\": " << s.entropy << ",\n";
        oss << ind << "  \"melting_temperature\": " << s.melting_temperature << ",\n";
        oss << ind << "  \"nucleotide_counts\": {";
        bool first = true;
        for (const auto& [base, count] : s.nucleotide_counts) {
            if (!first) oss << ", ";
            oss << quoted(std::string(1, base)) << ": " << count;
            first = false;
        }
        oss << "},\n";
        oss << ind << "  \"dinucleotide_frequencies\": "
            << json_frequencies(s.dinucleotide_frequencies) << ",\n";
        oss << ind << "  \"trinucleotide_frequencies\": "
            << json_frequencies(s.trinucleotide_frequencies) << "\n";
        oss << ind << "}";
        fields.push_back(oss.str());
    }

    if (r.motif_positions) {
        fields.push_back("\"motif_positions\": " + json_positions(*r.motif_positions));
    }

    if (r.repeats) {
        std::ostringstream oss;
        oss << "\"repeats\": {";
        bool first = true;
        for (const auto& [pattern, positions] : *r.repeats) {
            oss << (first ? "\n" : ",\n") << ind << "  " << quoted(pattern) << ": "
                << json_positions(positions);
            first = false;
        }
        if (!first) oss << "\n" << ind;
        oss << "}";
        fields.push_back(oss.str());
    }

    if (r.tandem_repeats) {
        std::ostringstream oss;
        oss << "\"tandem_repeats\": [";
        for (size_t i = 0; i < r.tandem_repeats->size(); ++i) {
            const TandemRepeat& tr = (*r.tandem_repeats)[i];
            oss << (i == 0 ? "\n" : ",\n") << ind << "  {\"pattern\": " << quoted(tr.pattern)
                << ", \"start\": " << tr.start << ", \"length\": " << tr.length
                << ", \"copies\": " << tr.copies << "}";
        }
        if (!r.tandem_repeats->empty()) oss << "\n" << ind;
        oss << "]";
        fields.push_back(oss.str());
    }

    if (r.orfs) {
        std::ostringstream oss;
        oss << "\"orfs\": [";
        for (size_t i = 0; i < r.orfs->size(); ++i) {
            const OrfRecord& orf = (*r.orfs)[i];
            oss << (i == 0 ? "\n" : ",\n") << ind << "  {\"start\": " << orf.start
                << ", \"frame\": " << orf.frame << ", \"length\": " << orf.length()
                << ", \"sequence\": " << quoted(orf.sequence) << "}";
        }
        if (!r.orfs->empty()) oss << "\n" << ind;
        oss << "]";
        fields.push_back(oss.str());
    }

    if (r.promoters) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6);
        oss << "\"promoters\": [";
        for (size_t i = 0; i < r.promoters->size(); ++i) {
            const PromoterSite& site = (*r.promoters)[i];
            oss << (i == 0 ? "\n" : ",\n") << ind << "  {\"start\": " << site.start
                << ", \"score\": " << site.score << "}";
        }
        if (!r.promoters->empty()) oss << "\n" << ind;
        oss << "]";
        fields.push_back(oss.str());
    }

    if (r.alignment_score) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6);
        oss << "\"alignment\": {\"score\": " << *r.alignment_score;
        if (r.alignment) {
            const LocalAlignment& aln = *r.alignment;
            oss << ", \"aligned1\": " << quoted(aln.aligned1)
                << ", \"aligned2\": " << quoted(aln.aligned2)
                << ", \"start1\": " << aln.start1 << ", \"end1\": " << aln.end1
                << ", \"start2\": " << aln.start2 << ", \"end2\": " << aln.end2
                << ", \"matches\": " << aln.matches
                << ", \"identity\": " << aln.identity();
        }
        oss << "}";
        fields.push_back(oss.str());
    }

    if (r.reverse_complement) {
        fields.push_back("\"reverse_complement\": " + quoted(*r.reverse_complement));
    }
    if (r.transcript) {
        fields.push_back("\"transcript\": " + quoted(*r.transcript));
    }
    if (r.protein) {
        fields.push_back("\"protein\": " + quoted(*r.protein));
    }

    os << "    {\n";
    for (size_t i = 0; i < fields.size(); ++i) {
        os << ind << fields[i] << (i + 1 < fields.size() ? ",\n" : "\n");
    }
    os << "    }";
}

}  // namespace

void write_json(std::ostream& os, const std::vector<RecordReport>& reports) {
    size_t failed = 0;
    for (const auto& r : reports) {
        if (!r.ok) ++failed;
    }

    os << "{\n";
    os << "  \"version\": \"" << NUCLEO_VERSION << "\",\n";
    os << "  \"sequences\": " << reports.size() << ",\n";
    os << "  \"failed\": " << failed << ",\n";
    os << "  \"records\": [";
    for (size_t i = 0; i < reports.size(); ++i) {
        os << (i == 0 ? "\n" : ",\n");
        write_record_json(os, reports[i]);
    }
    if (!reports.empty()) os << "\n  ";
    os << "]\n";
    os << "}\n";
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void write_csv_header(std::ostream& os) {
    os << "id,length,status,error_kind,error_message,"
       << "gc_content,molecular_weight,entropy,melting_temperature,nucleotide_counts,"
       << "motif_positions,repeats,tandem_repeats,orfs,promoters,"
       << "alignment_score,alignment_identity,"
       << "reverse_complement,transcript,protein\n";
}

void write_csv_row(std::ostream& os, const RecordReport& r) {
    std::vector<std::string> cells;

    auto number = [](double value) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6) << value;
        return oss.str();
    };
    auto count = [](const auto& opt) {
        return opt ? std::to_string(opt->size()) : std::string();
    };
    auto text = [](const std::optional<std::string>& opt) {
        return opt ? *opt : std::string();
    };

    cells.push_back(r.id);
    cells.push_back(std::to_string(r.length));
    cells.push_back(r.ok ? "ok" : "error");
    cells.push_back(r.ok ? "" : error_kind_name(r.error_kind));
    cells.push_back(r.ok ? "" : r.error_message);

    if (r.stats) {
        const CompositionStats& s = *r.stats;
        cells.push_back(number(s.gc_content));
        cells.push_back(number(s.molecular_weight));
        cells.push_back(number(s.entropy));
        cells.push_back(number(s.melting_temperature));
        std::ostringstream counts;
        bool first = true;
        for (const auto& [base, n] : s.nucleotide_counts) {
            if (!first) counts << ";";
            counts << base << "=" << n;
            first = false;
        }
        cells.push_back(counts.str());
    } else {
        cells.insert(cells.end(), 5, std::string());
    }

    cells.push_back(r.motif_positions ? join(*r.motif_positions, ";") : "");
    cells.push_back(count(r.repeats));
    cells.push_back(count(r.tandem_repeats));
    cells.push_back(count(r.orfs));
    cells.push_back(count(r.promoters));

    cells.push_back(r.alignment_score ? number(*r.alignment_score) : "");
    cells.push_back(r.alignment && r.alignment->length() > 0
                        ? number(r.alignment->identity()) : "");

    cells.push_back(text(r.reverse_complement));
    cells.push_back(text(r.transcript));
    cells.push_back(text(r.protein));

    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) os << ",";
        os << csv_escape(cells[i]);
    }
    os << "\n";
}

void write_csv(std::ostream& os, const std::vector<RecordReport>& reports) {
    write_csv_header(os);
    for (const auto& r : reports) {
        write_csv_row(os, r);
    }
}

size_t write_fasta(FastaWriter& writer, const RecordReport& report) {
    if (!report.ok) return 0;

    size_t written = 0;
    if (report.reverse_complement) {
        writer.write_sequence(report.id + "_revcomp", *report.reverse_complement,
                              "reverse complement");
        ++written;
    }
    if (report.transcript) {
        writer.write_sequence(report.id + "_transcript", *report.transcript, "transcript");
        ++written;
    }
    if (report.protein) {
        writer.write_sequence(report.id + "_protein", *report.protein, "translation");
        ++written;
    }
    return written;
}

}  // namespace cli
}  // namespace nucleo
