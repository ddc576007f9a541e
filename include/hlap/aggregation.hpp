#pragma once

#include "types.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace hlap {

// Union table columns
constexpr const char* UNION_COL_ALLELE = "Allele";
constexpr const char* UNION_COL_SEQUENCE = "Sequence";
constexpr const char* UNION_COL_LENGTH = "Length";
constexpr const char* UNION_COL_ACCESSIONS = "Master Protein Accessions";
constexpr const char* UNION_COL_DESCRIPTIONS = "Master Protein Descriptions";
constexpr const char* UNION_COL_COUNT = "Count";

// Per-run statistics. Removed counts come from the filter results; the
// length histogram and co-transduced set from the classified (final) records.
OverviewSummary summarize(const std::vector<ClassifiedRecord>& run,
                          const std::vector<FilterStageResult>& filter_results,
                          const RunMetadata& metadata = RunMetadata(),
                          const std::vector<CoTransducedGroup>& groups = {});

// Flatten a summary into overview table cells (column name, value)
ColumnValues overview_row(const OverviewSummary& summary);

// Union key: allele + normalized sequence
std::string union_key(const std::string& allele, const std::string& sequence);

/**
 * Merge one run into the union table.
 *
 * Every record adds 1 to the count of its (allele, normalized sequence)
 * entry; unseen keys are appended with count 1 and the record's metadata.
 * Existing entries keep their metadata and relative order, new entries follow
 * in first-encounter order.
 *
 * The merge is additive, not idempotent: merging the same records twice
 * counts them twice.
 */
std::vector<UnionEntry> merge_union(std::vector<UnionEntry> existing,
                                    const std::vector<ClassifiedRecord>& records,
                                    const std::string& allele);

/**
 * Persisted union table with a single read-modify-write operation.
 *
 * With a path, merge() loads the CSV (if present), merges and rewrites it in
 * full while holding both an in-process mutex and an advisory lock on
 * "<path>.lock", so concurrent merges never lose counts. Columns of an
 * existing file beyond the standard ones are carried through unchanged.
 * With an empty path the table lives in memory only.
 */
class UnionStore {
public:
    explicit UnionStore(std::string path = "");

    const std::string& path() const { return path_; }

    // Current contents. Throws SchemaMismatchError for an incompatible file.
    std::vector<UnionEntry> load() const;

    // Read-modify-write merge; returns the table as written
    std::vector<UnionEntry> merge(const std::vector<ClassifiedRecord>& records,
                                  const std::string& allele);

private:
    struct Snapshot {
        std::vector<UnionEntry> entries;
        std::vector<std::string> extra_columns;
    };

    Snapshot load_unlocked() const;
    void save_unlocked(const Snapshot& snapshot) const;

    std::string path_;
    Snapshot memory_;
    mutable std::mutex mutex_;
};

// Parse a union CSV. Throws SchemaMismatchError when Allele, Sequence or
// Count is missing or a cell cannot be read as its type.
std::vector<UnionEntry> read_union_table(const std::string& path,
                                         std::vector<std::string>* extra_columns = nullptr);

void write_union_table(const std::string& path,
                       const std::vector<UnionEntry>& entries,
                       const std::vector<std::string>& extra_columns = {});

/**
 * Overview table: one row per processed run, appended across invocations.
 * Columns are the union of all rows' keys in first-seen order.
 */
class OverviewTable {
public:
    explicit OverviewTable(std::string path = "");

    // Load rows from an existing file at path(), if any
    void load();

    void append(const ColumnValues& row);
    void append(const OverviewSummary& summary) { append(overview_row(summary)); }

    const std::vector<ColumnValues>& rows() const { return rows_; }
    std::vector<std::string> columns() const;

    // Rewrite the file in full (no-op for an in-memory table)
    void save() const;

private:
    std::string path_;
    std::vector<ColumnValues> rows_;
};

}  // namespace hlap
