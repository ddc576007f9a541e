#pragma once

#include "aggregation.hpp"
#include "cotransduction.hpp"
#include "filter_engine.hpp"
#include "peptide_table.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hlap {

struct PipelineConfig {
    FilterConfig filter;
    bool skip_cotransduction = false;
    bool assume_cotransduced = false;     // add one pattern inferred from the file name
    std::string cotransduced_patterns;    // comma-separated, may be empty
};

/**
 * Receives audit tables as soon as they are final. Implementations must not
 * touch tables written earlier in the run.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void write_table(const std::string& table_name,
                             const RunMetadata& metadata,
                             const std::vector<std::string>& header,
                             const std::vector<PeptideRecord>& records) = 0;
};

// Writes <dir>/<table>/<base name>_<table>.csv
class OutputDirectory : public AuditSink {
public:
    explicit OutputDirectory(std::string dir);

    const std::string& dir() const { return dir_; }
    std::string table_path(const std::string& table_name, const RunMetadata& metadata) const;

    void write_table(const std::string& table_name,
                     const RunMetadata& metadata,
                     const std::vector<std::string>& header,
                     const std::vector<PeptideRecord>& records) override;

private:
    std::string dir_;
};

// Audit directory names the file scan must never descend into
const std::vector<std::string>& audit_directory_names();

// "sp_peptides", "frag_peptides", "dup_peptides"
std::string removed_table_name(FilterStage stage);

// Kept table after the given enabled stages, newest first:
// {Contaminant, Fragment} -> "fragRM_spRM_peptides"
std::string kept_table_name(const std::vector<FilterStage>& enabled_stages);

constexpr const char* FINAL_TABLE = "final_peptides";
constexpr const char* FINAL_TABLE_8_14 = "final_peptides_8-14";
constexpr const char* COL_CO_TRANSDUCED = "Co-transduced";
constexpr const char* COL_MATCHED_PATTERN = "Matched Pattern";

struct RunResult {
    RunMetadata metadata;
    std::vector<FilterStageResult> stages;
    std::vector<ClassifiedRecord> classified;
    std::optional<std::string> inferred_pattern;
    std::vector<std::string> patterns;                   // compiled, in match order
    std::vector<PatternCompilationError> pattern_errors;
    OverviewSummary overview;
};

// Filter -> classify -> summarize one table. Pattern errors are collected,
// not thrown; empty tables give empty results.
RunResult run_pipeline(const PeptideTable& table,
                       const PipelineConfig& config,
                       AuditSink* audit = nullptr);

struct OutputPaths {
    std::string output_dir = "hla_files";
    std::string union_path;     // empty: <output_dir>/union_table.csv
    std::string overview_path;  // empty: <output_dir>/final_table.csv

    std::string resolved_union() const;
    std::string resolved_overview() const;
};

struct RunReport {
    size_t files_processed = 0;
    size_t files_failed = 0;
    size_t union_entries = 0;
};

// PeptideGroups files under `root` (a file or directory), sorted.
// Hidden entries and audit directories are skipped. Without `all_files`
// only names ending in "PeptideGroups.txt" (or ".txt.gz") are taken.
std::vector<std::string> find_peptide_files(const std::string& root, bool all_files);

// Process files one by one, appending to the union and overview tables
RunReport run_files(const std::vector<std::string>& files,
                    const PipelineConfig& config,
                    const OutputPaths& paths,
                    const std::string& allele_override = "");

// ---------------------------------------------------------------------------
// Bulk mode
// ---------------------------------------------------------------------------

struct ManifestEntry {
    std::string hla_allele;  // informational
    std::string file_name;
    std::string cotransduced;
};

class Manifest {
public:
    Manifest() = default;
    explicit Manifest(std::vector<ManifestEntry> entries) : entries_(std::move(entries)) {}

    // Match on the full path first, then on the file name alone
    const ManifestEntry* find(const std::string& path) const;
    size_t size() const { return entries_.size(); }

private:
    std::vector<ManifestEntry> entries_;
};

// Throws ManifestError when file_name or co-transduced protein(s) is missing
Manifest read_manifest(const std::string& path);

struct BulkConfig {
    PipelineConfig pipeline;
    std::string manifest_path;
    std::string bulk_dir;
    OutputPaths paths;
    bool all_files = false;
    int threads = 0;  // 0 = OpenMP default
};

struct BulkReport {
    size_t groups = 0;
    size_t files_processed = 0;
    size_t files_failed = 0;
    size_t union_entries = 0;
};

/**
 * Each sub-directory of bulk_dir is one group. Groups run in parallel and
 * write <output>/<group>/<group>_union.csv and _overview.csv. The global
 * union and overview are merged afterwards in sorted group order.
 */
BulkReport run_bulk(const BulkConfig& config);

}  // namespace hlap
