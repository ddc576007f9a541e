#include "hlap/aggregation.hpp"
#include "hlap/peptide_table.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <unordered_map>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace hlap {

namespace {

std::string join_values(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += "; ";
        out += values[i];
    }
    return out;
}

// Exclusive advisory lock held for the lifetime of the object
class FileLock {
public:
    explicit FileLock(const std::string& path) {
        const std::filesystem::path p(path);
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
        fd_ = ::open(path.c_str(), O_CREAT | O_RDWR, 0644);
        if (fd_ < 0) {
            throw std::runtime_error("Cannot open lock file " + path + ": " + std::strerror(errno));
        }
        if (::flock(fd_, LOCK_EX) != 0) {
            const int err = errno;
            ::close(fd_);
            throw std::runtime_error("Cannot lock " + path + ": " + std::strerror(err));
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

// Older union tables used the pipeline's internal column names
std::string canonical_union_column(const std::string& name) {
    if (name == "sequence" || name == "HLAP_sequence") return UNION_COL_SEQUENCE;
    if (name == "length" || name == "HLAP_length") return UNION_COL_LENGTH;
    if (name == "HLAP_master_accessions") return UNION_COL_ACCESSIONS;
    if (name == "HLAP_master_descriptions") return UNION_COL_DESCRIPTIONS;
    return name;
}

bool parse_int64(const std::string& text, int64_t& out) {
    const std::string t = trim(text);
    if (t.empty()) return false;
    size_t idx = 0;
    try {
        // pandas may write integral counts as "3.0"
        double v = std::stod(t, &idx);
        // 2^63 is exact as a double; anything at or past it does not fit
        if (idx != t.size() || !std::isfinite(v) || v < -9223372036854775808.0 ||
            v >= 9223372036854775808.0) {
            return false;
        }
        if (v != std::trunc(v)) return false;
        out = static_cast<int64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

OverviewSummary summarize(const std::vector<ClassifiedRecord>& run,
                          const std::vector<FilterStageResult>& filter_results,
                          const RunMetadata& metadata,
                          const std::vector<CoTransducedGroup>& groups) {
    OverviewSummary s;
    s.metadata = metadata;
    s.input_count = filter_results.empty()
        ? run.size()
        : filter_results.front().kept.size() + filter_results.front().removed.size();

    for (const auto& res : filter_results) {
        const size_t idx = static_cast<size_t>(res.stage);
        s.stage_enabled[idx] = res.enabled;
        switch (res.stage) {
            case FilterStage::Contaminant: s.contaminant_removed = res.removed.size(); break;
            case FilterStage::Fragment: s.fragment_removed = res.removed.size(); break;
            case FilterStage::Duplicate: s.duplicate_removed = res.removed.size(); break;
        }
    }

    s.total_peptides = run.size();
    for (const auto& cr : run) {
        s.length_histogram[cr.record.length]++;
        if (cr.co_transduced) {
            s.co_transduced_count++;
            s.co_transduced_sequences.push_back(cr.record.sequence);
        }
    }
    s.co_transduced_groups = groups;
    return s;
}

ColumnValues overview_row(const OverviewSummary& s) {
    ColumnValues row;
    row.emplace_back("file_name", s.metadata.file_name);
    row.emplace_back("date_created", s.metadata.date_created);
    row.emplace_back("HLA_allele", s.metadata.hla_allele);
    row.emplace_back("input_count", std::to_string(s.input_count));
    row.emplace_back("sp_count", std::to_string(s.contaminant_removed));
    row.emplace_back("fragment_count", std::to_string(s.fragment_removed));
    row.emplace_back("duplicate_count", std::to_string(s.duplicate_removed));
    row.emplace_back("total_peptides", std::to_string(s.total_peptides));
    row.emplace_back("co-transduced_count", std::to_string(s.co_transduced_count));
    for (int len = 7; len <= 14; ++len) {
        row.emplace_back(std::to_string(len) + "mers", std::to_string(s.count_of_length(len)));
    }
    for (size_t i = 0; i < s.co_transduced_groups.size(); ++i) {
        const auto& g = s.co_transduced_groups[i];
        std::string peptides;
        for (size_t j = 0; j < g.peptides.size(); ++j) {
            if (j) peptides += ", ";
            peptides += g.peptides[j];
        }
        row.emplace_back("co-transduced_protein_" + std::to_string(i), g.protein);
        row.emplace_back("co-transduced_peptides_" + std::to_string(i), peptides);
    }
    return row;
}

std::string union_key(const std::string& allele, const std::string& sequence) {
    return allele + '\t' + to_upper(sequence);
}

std::vector<UnionEntry> merge_union(std::vector<UnionEntry> existing,
                                    const std::vector<ClassifiedRecord>& records,
                                    const std::string& allele) {
    std::unordered_map<std::string, size_t> index;
    index.reserve(existing.size() + records.size());
    for (size_t i = 0; i < existing.size(); ++i) {
        index.emplace(union_key(existing[i].allele, existing[i].sequence), i);
    }

    for (const auto& cr : records) {
        const PeptideRecord& rec = cr.record;
        const std::string key = union_key(allele, rec.sequence);
        auto it = index.find(key);
        if (it != index.end()) {
            existing[it->second].count += 1;
            continue;
        }
        UnionEntry e;
        e.allele = allele;
        e.sequence = rec.normalized_sequence();
        e.length = rec.length;
        e.master_accessions = join_values(rec.master_accessions);
        e.master_descriptions = join_values(rec.master_descriptions);
        e.count = 1;
        index.emplace(key, existing.size());
        existing.push_back(std::move(e));
    }
    return existing;
}

std::vector<UnionEntry> read_union_table(const std::string& path,
                                         std::vector<std::string>* extra_columns) {
    const Table table = read_csv(path);

    int col_allele = -1, col_seq = -1, col_len = -1, col_acc = -1, col_desc = -1, col_count = -1;
    std::vector<int> extra_idx;
    for (size_t i = 0; i < table.header.size(); ++i) {
        const std::string name = canonical_union_column(table.header[i]);
        const int c = static_cast<int>(i);
        if (name == UNION_COL_ALLELE && col_allele < 0) col_allele = c;
        else if (name == UNION_COL_SEQUENCE && col_seq < 0) col_seq = c;
        else if (name == UNION_COL_LENGTH && col_len < 0) col_len = c;
        else if (name == UNION_COL_ACCESSIONS && col_acc < 0) col_acc = c;
        else if (name == UNION_COL_DESCRIPTIONS && col_desc < 0) col_desc = c;
        else if (name == UNION_COL_COUNT && col_count < 0) col_count = c;
        else extra_idx.push_back(c);
    }

    std::vector<std::string> missing;
    if (col_allele < 0) missing.push_back(UNION_COL_ALLELE);
    if (col_seq < 0) missing.push_back(UNION_COL_SEQUENCE);
    if (col_count < 0) missing.push_back(UNION_COL_COUNT);
    if (!missing.empty()) throw SchemaMismatchError(path, missing);

    if (extra_columns) {
        extra_columns->clear();
        for (int c : extra_idx) extra_columns->push_back(table.header[c]);
    }

    std::vector<UnionEntry> entries;
    entries.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        UnionEntry e;
        e.allele = row[col_allele];
        e.sequence = to_upper(trim(row[col_seq]));
        if (e.sequence.empty()) {
            throw SchemaMismatchError(path, "row " + std::to_string(r + 1) + " has an empty Sequence");
        }
        if (!parse_int64(row[col_count], e.count) || e.count < 1) {
            throw SchemaMismatchError(path, "row " + std::to_string(r + 1) +
                                            ": invalid Count '" + row[col_count] + "'");
        }
        if (col_len >= 0) {
            int64_t len = 0;
            if (!trim(row[col_len]).empty()) {
                if (!parse_int64(row[col_len], len) || len < 0 ||
                    len > std::numeric_limits<int>::max()) {
                    throw SchemaMismatchError(path, "row " + std::to_string(r + 1) +
                                                    ": invalid Length '" + row[col_len] + "'");
                }
            } else {
                len = static_cast<int64_t>(e.sequence.size());
            }
            e.length = static_cast<int>(len);
        } else {
            e.length = static_cast<int>(e.sequence.size());
        }
        if (col_acc >= 0) e.master_accessions = row[col_acc];
        if (col_desc >= 0) e.master_descriptions = row[col_desc];
        for (int c : extra_idx) e.extra.emplace_back(table.header[c], row[c]);
        entries.push_back(std::move(e));
    }
    return entries;
}

void write_union_table(const std::string& path,
                       const std::vector<UnionEntry>& entries,
                       const std::vector<std::string>& extra_columns) {
    std::vector<std::string> header = {UNION_COL_ALLELE, UNION_COL_SEQUENCE, UNION_COL_LENGTH,
                                       UNION_COL_ACCESSIONS, UNION_COL_DESCRIPTIONS,
                                       UNION_COL_COUNT};
    header.insert(header.end(), extra_columns.begin(), extra_columns.end());

    std::vector<std::vector<std::string>> rows;
    rows.reserve(entries.size());
    for (const auto& e : entries) {
        std::vector<std::string> row = {e.allele, e.sequence, std::to_string(e.length),
                                        e.master_accessions, e.master_descriptions,
                                        std::to_string(e.count)};
        for (const auto& col : extra_columns) {
            std::string value;
            for (const auto& kv : e.extra) {
                if (kv.first == col) {
                    value = kv.second;
                    break;
                }
            }
            row.push_back(std::move(value));
        }
        rows.push_back(std::move(row));
    }
    write_csv(path, header, rows);
}

// ---------------------------------------------------------------------------
// UnionStore
// ---------------------------------------------------------------------------

UnionStore::UnionStore(std::string path) : path_(std::move(path)) {}

UnionStore::Snapshot UnionStore::load_unlocked() const {
    if (path_.empty()) return memory_;
    Snapshot snap;
    if (std::filesystem::exists(path_)) {
        snap.entries = read_union_table(path_, &snap.extra_columns);
    }
    return snap;
}

void UnionStore::save_unlocked(const Snapshot& snapshot) const {
    write_union_table(path_, snapshot.entries, snapshot.extra_columns);
}

std::vector<UnionEntry> UnionStore::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_unlocked().entries;
}

std::vector<UnionEntry> UnionStore::merge(const std::vector<ClassifiedRecord>& records,
                                          const std::string& allele) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) {
        memory_.entries = merge_union(std::move(memory_.entries), records, allele);
        return memory_.entries;
    }

    FileLock file_lock(path_ + ".lock");
    Snapshot snap = load_unlocked();
    snap.entries = merge_union(std::move(snap.entries), records, allele);
    save_unlocked(snap);
    return snap.entries;
}

// ---------------------------------------------------------------------------
// OverviewTable
// ---------------------------------------------------------------------------

OverviewTable::OverviewTable(std::string path) : path_(std::move(path)) {}

void OverviewTable::load() {
    rows_.clear();
    if (path_.empty() || !std::filesystem::exists(path_)) return;
    const Table table = read_csv(path_);
    for (const auto& cells : table.rows) {
        ColumnValues row;
        for (size_t c = 0; c < table.header.size(); ++c) {
            if (table.header[c].empty()) continue;  // pandas index column
            row.emplace_back(table.header[c], cells[c]);
        }
        rows_.push_back(std::move(row));
    }
}

void OverviewTable::append(const ColumnValues& row) {
    rows_.push_back(row);
}

std::vector<std::string> OverviewTable::columns() const {
    std::vector<std::string> cols;
    for (const auto& row : rows_) {
        for (const auto& kv : row) {
            if (std::find(cols.begin(), cols.end(), kv.first) == cols.end()) {
                cols.push_back(kv.first);
            }
        }
    }
    return cols;
}

void OverviewTable::save() const {
    if (path_.empty()) return;
    const auto cols = columns();
    std::vector<std::vector<std::string>> rows;
    rows.reserve(rows_.size());
    for (const auto& row : rows_) {
        std::vector<std::string> cells(cols.size());
        for (const auto& kv : row) {
            auto it = std::find(cols.begin(), cols.end(), kv.first);
            cells[static_cast<size_t>(it - cols.begin())] = kv.second;
        }
        rows.push_back(std::move(cells));
    }
    write_csv(path_, cols, rows);
}

}  // namespace hlap
