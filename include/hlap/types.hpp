#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hlap {

// Ordered pass-through of the original table row: (column name, raw value)
using ColumnValues = std::vector<std::pair<std::string, std::string>>;

inline std::string to_upper(std::string s) {
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

inline std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

/**
 * One row of a PeptideGroups table.
 *
 * Built once by the table reader and never modified afterwards; every
 * pipeline stage copies the records it keeps into a new collection.
 */
struct PeptideRecord {
    std::vector<std::string> master_accessions;    // "Master Protein Accessions", split on ';'
    std::vector<std::string> master_descriptions;  // "Master Protein Descriptions", split on ';'
    std::string sequence;
    int length = 0;
    std::optional<double> retention_time;          // first "RT*" column, when numeric
    size_t row_index = 0;                          // 0-based data row in the input table
    ColumnValues columns;                          // all original columns, input order

    // Case-folded sequence; identity for deduplication and the union table
    std::string normalized_sequence() const { return to_upper(sequence); }

    // Original cell value, or nullptr when the column is absent
    const std::string* column(const std::string& name) const {
        for (const auto& kv : columns) {
            if (kv.first == name) return &kv.second;
        }
        return nullptr;
    }
};

// Cascading stages, in the fixed order they run
enum class FilterStage : uint8_t {
    Contaminant = 0,
    Fragment = 1,
    Duplicate = 2
};

constexpr size_t NUM_FILTER_STAGES = 3;

inline const char* filter_stage_name(FilterStage stage) {
    switch (stage) {
        case FilterStage::Contaminant: return "contaminant";
        case FilterStage::Fragment: return "fragment";
        case FilterStage::Duplicate: return "duplicate";
    }
    return "unknown";
}

// Short tag used in audit table names ("sp_peptides", "fragRM_spRM_peptides")
inline const char* filter_stage_tag(FilterStage stage) {
    switch (stage) {
        case FilterStage::Contaminant: return "sp";
        case FilterStage::Fragment: return "frag";
        case FilterStage::Duplicate: return "dup";
    }
    return "unknown";
}

struct FilterStageResult {
    FilterStage stage = FilterStage::Contaminant;
    bool enabled = true;
    std::vector<PeptideRecord> kept;     // input order
    std::vector<PeptideRecord> removed;  // input order, disjoint from kept
};

struct ClassifiedRecord {
    PeptideRecord record;
    bool co_transduced = false;
    std::optional<std::string> matched_pattern;   // raw text of first matching pattern
    std::vector<std::string> matched_values;      // accession/description values it matched
};

// Accession or description value hit by a pattern, with the peptides carrying it
struct CoTransducedGroup {
    std::string pattern;
    std::string protein;
    std::vector<std::string> peptides;  // sorted, unique
};

struct UnionEntry {
    std::string allele;
    std::string sequence;  // normalized
    int length = 0;
    std::string master_accessions;
    std::string master_descriptions;
    int64_t count = 1;
    ColumnValues extra;  // unrecognized columns of a loaded table, kept verbatim
};

// Run-level metadata taken from the input file name
struct RunMetadata {
    std::string file_name;
    std::string base_name;
    std::string date_created;
    std::string hla_allele;
};

struct OverviewSummary {
    RunMetadata metadata;
    size_t input_count = 0;
    size_t contaminant_removed = 0;
    size_t fragment_removed = 0;
    size_t duplicate_removed = 0;
    size_t total_peptides = 0;
    size_t co_transduced_count = 0;
    std::vector<std::string> co_transduced_sequences;
    std::vector<CoTransducedGroup> co_transduced_groups;
    std::map<int, size_t> length_histogram;
    bool stage_enabled[NUM_FILTER_STAGES] = {true, true, true};

    size_t count_of_length(int len) const {
        auto it = length_histogram.find(len);
        return it == length_histogram.end() ? 0 : it->second;
    }
};

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

class PeptideFileError : public std::runtime_error {
public:
    explicit PeptideFileError(const std::string& msg) : std::runtime_error(msg) {}
};

class PatternCompilationError : public std::runtime_error {
public:
    PatternCompilationError(const std::string& pattern, const std::string& reason)
        : std::runtime_error("Invalid co-transduced pattern '" + pattern + "': " + reason),
          pattern_(pattern) {}

    const std::string& pattern() const { return pattern_; }

private:
    std::string pattern_;
};

class SchemaMismatchError : public std::runtime_error {
public:
    SchemaMismatchError(const std::string& path, std::vector<std::string> missing)
        : std::runtime_error(build_message(path, missing)),
          path_(path), missing_(std::move(missing)) {}

    SchemaMismatchError(const std::string& path, const std::string& detail)
        : std::runtime_error("Incompatible table " + path + ": " + detail),
          path_(path) {}

    const std::string& path() const { return path_; }
    const std::vector<std::string>& missing_columns() const { return missing_; }

private:
    static std::string build_message(const std::string& path,
                                     const std::vector<std::string>& missing) {
        std::string msg = "Incompatible table " + path + ": missing column(s)";
        for (size_t i = 0; i < missing.size(); ++i) {
            msg += (i == 0 ? " '" : ", '") + missing[i] + "'";
        }
        return msg;
    }

    std::string path_;
    std::vector<std::string> missing_;
};

class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace hlap
