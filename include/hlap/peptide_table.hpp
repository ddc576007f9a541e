#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hlap {

/**
 * Line reader for plain or gzip-compressed text tables.
 *
 * Files ending in ".gz" are read through zlib, everything else through an
 * ifstream. Trailing '\r' is stripped so CRLF exports read the same.
 */
class LineReader {
public:
    explicit LineReader(const std::string& filename);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Read next line without the newline. Returns false at end of file.
    bool read_line(std::string& line);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// In-memory delimited table (header + string cells)
struct Table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    // Column position, or -1 when absent
    int column_index(const std::string& name) const;
};

// Split one TSV line on tabs (no quoting, as ProteomeDiscoverer writes it)
std::vector<std::string> split_tsv_line(const std::string& line);

// Read a tab-separated table. Throws PeptideFileError on unreadable input.
Table read_tsv(const std::string& path);

// Read a comma-separated table with RFC 4180 quoting (quoted fields may
// span lines). Throws PeptideFileError on unreadable input.
Table read_csv(const std::string& path);

// Quote a CSV field when it contains a comma, quote or line break
std::string csv_escape(const std::string& field);

// Write a CSV table atomically (temporary file renamed into place).
// Parent directories are created. Throws std::runtime_error on I/O failure.
void write_csv(const std::string& path,
               const std::vector<std::string>& header,
               const std::vector<std::vector<std::string>>& rows);

// Write records with their original columns, in `header` order
void write_records_csv(const std::string& path,
                       const std::vector<std::string>& header,
                       const std::vector<PeptideRecord>& records);

// ---------------------------------------------------------------------------
// File name conventions: <run>_<date>_HLA_<allele>_<proteins...>_bRP_PeptideGroups.txt
// ---------------------------------------------------------------------------

// File name without directory and "_PeptideGroups.txt" / ".txt" suffix
std::string base_name(const std::string& path);

// Underscore tokens of the base name
std::vector<std::string> name_tokens(const std::string& path);

// Second token of the base name, empty when absent
std::string infer_date_created(const std::string& path);

// "HLA_<type>" when the third token is "HLA", the third token itself when it
// starts with "HLA" (e.g. "HLAB7"), otherwise nullopt
std::optional<std::string> infer_allele(const std::string& path);

RunMetadata describe_file(const std::string& path,
                          const std::string& allele_override = "");

// ---------------------------------------------------------------------------
// PeptideGroups tables
// ---------------------------------------------------------------------------

constexpr const char* COL_SEQUENCE = "Sequence";
constexpr const char* COL_ANNOTATED_SEQUENCE = "Annotated Sequence";
constexpr const char* COL_MASTER_ACCESSIONS = "Master Protein Accessions";
constexpr const char* COL_MASTER_DESCRIPTIONS = "Master Protein Descriptions";

struct PeptideTable {
    RunMetadata metadata;
    std::vector<std::string> header;
    std::vector<PeptideRecord> records;
    std::vector<std::string> warnings;  // missing optional columns etc.
};

// Split a multi-valued cell on ';', trimming values and dropping empties
std::vector<std::string> split_multi_value(const std::string& cell);

// "[K].AAAGSLSR.[T]" -> "AAAGSLSR"; text without two dots is returned as is
std::string strip_annotated_sequence(const std::string& annotated);

// Convert a parsed table into records. `source` names the table in errors.
// Throws PeptideFileError when no sequence column exists.
PeptideTable records_from_table(const Table& table, const std::string& source);

// Read and standardize a PeptideGroups TSV (plain or .gz)
PeptideTable read_peptide_table(const std::string& path,
                                const std::string& allele_override = "");

}  // namespace hlap
