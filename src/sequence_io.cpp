#include "nucleo/sequence_io.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace nucleo {

// Large I/O buffer for better throughput
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

static bool has_gz_suffix(const std::string& filename) {
    return filename.size() > 3 &&
           filename.compare(filename.size() - 3, 3, ".gz") == 0;
}

// Drop trailing '\r' and embedded whitespace from a sequence line
static void append_sequence_line(std::string& sequence, const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            sequence += c;
        }
    }
}

// FastaReader implementation
class FastaReader::Impl {
public:
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    bool is_gzipped_ = false;
    char buffer_[65536];          // Line buffer for gzgets
    std::string lookahead_line_;  // Header of the next record
    bool has_lookahead_ = false;

    bool open(const std::string& filename) {
        is_gzipped_ = has_gz_suffix(filename);
        if (is_gzipped_) {
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);
            return true;
        }
        file_.open(filename);
        return static_cast<bool>(file_);
    }

    // Read one full line (gzgets may split lines longer than the buffer)
    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (!std::getline(file_, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        line.clear();
        bool got_any = false;
        while (gzgets(gz_file_, buffer_, sizeof(buffer_)) != nullptr) {
            got_any = true;
            size_t len = strlen(buffer_);
            bool complete = len > 0 && buffer_[len - 1] == '\n';
            if (complete) len--;
            line.append(buffer_, len);
            if (complete) break;
        }
        if (!got_any) {
            int err = Z_OK;
            const char* msg = gzerror(gz_file_, &err);
            if (err != Z_OK && err != Z_STREAM_END) {
                throw std::runtime_error(std::string("gzip read error: ") + msg);
            }
            return false;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool is_open() const {
        return is_gzipped_ ? (gz_file_ != nullptr) : file_.is_open();
    }

    void close() {
        if (is_gzipped_) {
            if (gz_file_) {
                gzclose(gz_file_);
                gz_file_ = nullptr;
            }
        } else {
            file_.close();
        }
    }

    ~Impl() {
        close();
    }
};

FastaReader::FastaReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
}

FastaReader::~FastaReader() = default;

bool FastaReader::read_next(SequenceRecord& record) {
    std::string line;

    if (impl_->has_lookahead_) {
        line = std::move(impl_->lookahead_line_);
        impl_->has_lookahead_ = false;
    } else {
        // Skip blank and comment lines before the first header
        do {
            if (!impl_->getline(line)) return false;
        } while (line.empty() || line[0] == ';');
    }

    if (line[0] != '>') {
        throw std::runtime_error("Invalid FASTA format: expected '>' header, got: " +
                                 line.substr(0, 40));
    }

    // Parse header
    const char* hdr = line.c_str() + 1;  // Skip '>'
    const char* space = strpbrk(hdr, " \t");
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }

    // Read sequence lines until next header or EOF
    record.sequence.clear();
    while (impl_->getline(line)) {
        if (line.empty() || line[0] == ';') continue;
        if (line[0] == '>') {
            // Save for next call
            impl_->lookahead_line_ = std::move(line);
            impl_->has_lookahead_ = true;
            break;
        }
        append_sequence_line(record.sequence, line);
    }

    return true;
}

void FastaReader::for_each(const std::function<void(const SequenceRecord&)>& callback) {
    SequenceRecord record;
    while (read_next(record)) {
        callback(record);
    }
}

std::vector<SequenceRecord> FastaReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

bool FastaReader::is_open() const {
    return impl_->is_open();
}

// FastaWriter implementation
class FastaWriter::Impl {
public:
    std::ofstream file_;
    gzFile gz_file_ = nullptr;
    bool compress_ = false;
    size_t line_width_ = 60;

    void write(const char* data, size_t len) {
        if (compress_) {
            if (len > 0 && gzwrite(gz_file_, data, static_cast<unsigned>(len)) == 0) {
                int err = Z_OK;
                throw std::runtime_error(std::string("gzip write error: ") +
                                         gzerror(gz_file_, &err));
            }
        } else {
            file_.write(data, static_cast<std::streamsize>(len));
        }
    }

    void write(const std::string& str) {
        write(str.data(), str.size());
    }

    void close() {
        if (compress_) {
            if (gz_file_) {
                gzclose(gz_file_);
                gz_file_ = nullptr;
            }
        } else if (file_.is_open()) {
            file_.close();
        }
    }

    ~Impl() {
        close();
    }
};

FastaWriter::FastaWriter(const std::string& filename, bool compress, size_t line_width)
    : impl_(std::make_unique<Impl>()) {
    impl_->compress_ = compress || has_gz_suffix(filename);
    impl_->line_width_ = line_width == 0 ? 60 : line_width;

    if (impl_->compress_) {
        impl_->gz_file_ = gzopen(filename.c_str(), "wb");
        if (!impl_->gz_file_) {
            throw std::runtime_error("Failed to open file: " + filename);
        }
    } else {
        impl_->file_.open(filename);
        if (!impl_->file_) {
            throw std::runtime_error("Failed to open file: " + filename);
        }
    }
}

FastaWriter::~FastaWriter() = default;

void FastaWriter::write(const SequenceRecord& record) {
    write_sequence(record.id, record.sequence, record.description);
}

void FastaWriter::write_sequence(const std::string& id, const std::string& sequence,
                                 const std::string& description) {
    std::string header = ">" + id;
    if (!description.empty()) {
        header += " " + description;
    }
    header += "\n";
    impl_->write(header);

    const size_t width = impl_->line_width_;
    for (size_t i = 0; i < sequence.size(); i += width) {
        const size_t len = std::min(width, sequence.size() - i);
        impl_->write(sequence.data() + i, len);
        impl_->write("\n", 1);
    }
}

void FastaWriter::close() {
    impl_->close();
}

} // namespace nucleo
