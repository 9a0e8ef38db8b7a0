#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nucleo {

/**
 * Sequence record from a FASTA file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
};

/**
 * FASTA file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files (".gz" suffix)
 * - Multi-line records, blank lines and ';' comment lines
 * - Iterator-style and callback-based processing
 *
 * Throws std::runtime_error when the file cannot be opened or does not
 * start with a '>' header.
 */
class FastaReader {
public:
    explicit FastaReader(const std::string& filename);
    ~FastaReader();

    /**
     * Read next record
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    /**
     * Process all records with a callback
     */
    void for_each(const std::function<void(const SequenceRecord&)>& callback);

    /**
     * Read all records into memory
     */
    std::vector<SequenceRecord> read_all();

    bool is_open() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * FASTA writer (optionally gzip-compressed)
 */
class FastaWriter {
public:
    explicit FastaWriter(const std::string& filename, bool compress = false,
                         size_t line_width = 60);
    ~FastaWriter();

    void write(const SequenceRecord& record);
    void write_sequence(const std::string& id, const std::string& sequence,
                        const std::string& description = "");

    /**
     * Flush and close file
     */
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nucleo
