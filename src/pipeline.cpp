#include "hlap/pipeline.hpp"
#include "hlap/log_utils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace hlap {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Final tables carry the classification next to the original columns
std::vector<PeptideRecord> annotate(const std::vector<ClassifiedRecord>& classified) {
    std::vector<PeptideRecord> out;
    out.reserve(classified.size());
    for (const auto& cr : classified) {
        PeptideRecord rec = cr.record;
        rec.columns.emplace_back(COL_CO_TRANSDUCED, cr.co_transduced ? "TRUE" : "FALSE");
        rec.columns.emplace_back(COL_MATCHED_PATTERN, cr.matched_pattern.value_or(""));
        out.push_back(std::move(rec));
    }
    return out;
}

void collect_files(const fs::path& dir, bool all_files, std::vector<std::string>& out) {
    const auto& skip = audit_directory_names();
    for (const auto& entry : fs::directory_iterator(dir)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        // Union lock files and in-flight CSV writes
        if (ends_with(name, ".lock") || name.find(".tmp.") != std::string::npos) continue;
        if (entry.is_directory()) {
            if (std::find(skip.begin(), skip.end(), name) != skip.end()) continue;
            collect_files(entry.path(), all_files, out);
        } else if (entry.is_regular_file()) {
            if (all_files || ends_with(name, "PeptideGroups.txt") ||
                ends_with(name, "PeptideGroups.txt.gz")) {
                out.push_back(entry.path().string());
            }
        }
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// Audit tables
// ---------------------------------------------------------------------------

OutputDirectory::OutputDirectory(std::string dir) : dir_(std::move(dir)) {}

std::string OutputDirectory::table_path(const std::string& table_name,
                                        const RunMetadata& metadata) const {
    return (fs::path(dir_) / table_name / (metadata.base_name + "_" + table_name + ".csv")).string();
}

void OutputDirectory::write_table(const std::string& table_name,
                                  const RunMetadata& metadata,
                                  const std::vector<std::string>& header,
                                  const std::vector<PeptideRecord>& records) {
    write_records_csv(table_path(table_name, metadata), header, records);
}

const std::vector<std::string>& audit_directory_names() {
    static const std::vector<std::string> names = {
        "sp_peptides", "spRM_peptides", "frag_peptides", "fragRM_peptides",
        "fragRM_spRM_peptides", "dup_peptides", "dupRM_peptides", "dupRM_spRM_peptides",
        "dupRM_fragRM_peptides", "dupRM_fragRM_spRM_peptides", "final_peptides",
        "final_peptides_8-14", "image_output", "logo_results"};
    return names;
}

std::string removed_table_name(FilterStage stage) {
    return std::string(filter_stage_tag(stage)) + "_peptides";
}

std::string kept_table_name(const std::vector<FilterStage>& enabled_stages) {
    std::string name;
    for (auto it = enabled_stages.rbegin(); it != enabled_stages.rend(); ++it) {
        name += std::string(filter_stage_tag(*it)) + "RM_";
    }
    return name + "peptides";
}

// ---------------------------------------------------------------------------
// Single run
// ---------------------------------------------------------------------------

RunResult run_pipeline(const PeptideTable& table,
                       const PipelineConfig& config,
                       AuditSink* audit) {
    auto& log = log_utils::Log::instance();
    RunResult result;
    result.metadata = table.metadata;
    log.detail("File contains " + std::to_string(table.records.size()) + " peptides");

    std::vector<FilterStage> enabled;
    result.stages = run_filters(table.records, config.filter,
        [&](const FilterStageResult& stage) {
            if (!stage.enabled) return;
            enabled.push_back(stage.stage);
            log.detail(std::string("Removing ") + std::to_string(stage.removed.size()) + " " +
                       filter_stage_name(stage.stage) + " peptides");
            if (audit) {
                audit->write_table(removed_table_name(stage.stage), result.metadata,
                                   table.header, stage.removed);
                audit->write_table(kept_table_name(enabled), result.metadata,
                                   table.header, stage.kept);
            }
        });
    const auto& kept = final_kept(result.stages, table.records);
    log.detail("There are now " + std::to_string(kept.size()) + " peptides remaining");

    std::vector<std::string> raw_patterns;
    if (!config.skip_cotransduction) {
        if (config.assume_cotransduced) {
            result.inferred_pattern = infer_pattern_from_filename(table.metadata.file_name);
            if (result.inferred_pattern) {
                raw_patterns.push_back(*result.inferred_pattern);
            } else {
                log.warn("Could not infer a co-transduced protein from " + table.metadata.file_name);
            }
        }
        for (auto& p : split_pattern_list(config.cotransduced_patterns)) {
            raw_patterns.push_back(std::move(p));
        }
    }

    PatternSet set = compile_patterns(raw_patterns);
    for (const auto& err : set.errors) {
        log.warn(err.what());
    }
    result.pattern_errors = set.errors;
    for (const auto& p : set.patterns) result.patterns.push_back(p.raw_expression);

    result.classified = classify(kept, set.patterns);
    auto groups = collect_groups(result.classified, set.patterns);
    for (const auto& p : set.patterns) {
        size_t n_groups = 0;
        size_t n_peptides = 0;
        for (const auto& g : groups) {
            if (g.pattern != p.raw_expression) continue;
            ++n_groups;
            n_peptides += g.peptides.size();
        }
        log.detail("- " + p.raw_expression + " matches: " + std::to_string(n_peptides) +
                   " peptides in " + std::to_string(n_groups) + " groups");
    }

    result.overview = summarize(result.classified, result.stages, result.metadata, groups);

    if (audit) {
        std::vector<std::string> header = table.header;
        header.push_back(COL_CO_TRANSDUCED);
        header.push_back(COL_MATCHED_PATTERN);
        const auto final_records = annotate(result.classified);
        audit->write_table(FINAL_TABLE, result.metadata, header, final_records);

        std::vector<PeptideRecord> mid;
        for (const auto& rec : final_records) {
            if (rec.length >= 8 && rec.length <= 14) mid.push_back(rec);
        }
        audit->write_table(FINAL_TABLE_8_14, result.metadata, header, mid);
    }
    return result;
}

// ---------------------------------------------------------------------------
// Multi-file runs
// ---------------------------------------------------------------------------

std::string OutputPaths::resolved_union() const {
    return union_path.empty() ? (fs::path(output_dir) / "union_table.csv").string() : union_path;
}

std::string OutputPaths::resolved_overview() const {
    return overview_path.empty() ? (fs::path(output_dir) / "final_table.csv").string()
                                 : overview_path;
}

std::vector<std::string> find_peptide_files(const std::string& root, bool all_files) {
    std::vector<std::string> files;
    const fs::path p(root);
    if (!fs::exists(p)) {
        log_utils::Log::instance().warn("file not found: " + root);
        return files;
    }
    if (fs::is_directory(p)) {
        collect_files(p, all_files, files);
    } else {
        files.push_back(root);
    }
    std::sort(files.begin(), files.end());
    return files;
}

RunReport run_files(const std::vector<std::string>& files,
                    const PipelineConfig& config,
                    const OutputPaths& paths,
                    const std::string& allele_override) {
    auto& log = log_utils::Log::instance();
    RunReport report;

    fs::create_directories(paths.output_dir);
    OutputDirectory out(paths.output_dir);
    UnionStore union_store(paths.resolved_union());
    OverviewTable overview(paths.resolved_overview());
    overview.load();
    if (!overview.rows().empty()) {
        log.info("Previous overview table found, appending new rows");
    }

    for (const auto& path : files) {
        log.info("Processing " + path);
        const auto t_start = std::chrono::steady_clock::now();
        RunResult result;
        try {
            PeptideTable table = read_peptide_table(path, allele_override);
            for (const auto& w : table.warnings) log.warn(w);
            if (table.metadata.hla_allele.empty()) {
                log.warn("Could not infer HLA allele for " + path);
            }
            result = run_pipeline(table, config, &out);
        } catch (const std::exception& e) {
            log.error(path + ": " + e.what());
            ++report.files_failed;
            continue;
        }

        overview.append(result.overview);
        try {
            union_store.merge(result.classified, result.metadata.hla_allele);
        } catch (const SchemaMismatchError&) {
            // A bad union table stops the run, rows gathered so far are kept
            overview.save();
            throw;
        }
        ++report.files_processed;
        log.info("  " + std::to_string(result.overview.total_peptides) + " peptides kept, " +
                 std::to_string(result.overview.co_transduced_count) + " co-transduced (" +
                 log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()) + ")");
    }

    overview.save();
    report.union_entries = union_store.load().size();
    return report;
}

// ---------------------------------------------------------------------------
// Bulk mode
// ---------------------------------------------------------------------------

const ManifestEntry* Manifest::find(const std::string& path) const {
    for (const auto& e : entries_) {
        if (e.file_name == path) return &e;
    }
    const std::string name = fs::path(path).filename().string();
    for (const auto& e : entries_) {
        if (fs::path(e.file_name).filename().string() == name) return &e;
    }
    return nullptr;
}

Manifest read_manifest(const std::string& path) {
    if (!fs::exists(path)) {
        throw ManifestError("Invalid bulk csv: " + path);
    }
    const Table table = read_csv(path);
    const int col_file = table.column_index("file_name");
    const int col_cotrans = table.column_index("co-transduced protein(s)");
    const int col_allele = table.column_index("HLA_allele");
    if (col_file < 0 || col_cotrans < 0) {
        throw ManifestError("Bulk csv " + path +
                            " needs 'file_name' and 'co-transduced protein(s)' columns");
    }

    std::vector<ManifestEntry> entries;
    for (const auto& row : table.rows) {
        ManifestEntry e;
        e.file_name = trim(row[col_file]);
        e.cotransduced = trim(row[col_cotrans]);
        if (col_allele >= 0) e.hla_allele = trim(row[col_allele]);
        if (e.cotransduced == "nan" || e.cotransduced == "NaN") e.cotransduced.clear();
        entries.push_back(std::move(e));
    }
    return Manifest(std::move(entries));
}

namespace {

struct FileOutcome {
    bool ok = false;
    std::string allele;
    std::vector<ClassifiedRecord> classified;
    OverviewSummary overview;
};

struct GroupOutcome {
    std::string name;
    std::vector<FileOutcome> files;
    std::string error;
};

GroupOutcome run_group(const fs::path& group_dir, const Manifest& manifest,
                       const BulkConfig& config) {
    auto& log = log_utils::Log::instance();
    GroupOutcome outcome;
    outcome.name = group_dir.filename().string();

    const fs::path out_dir = fs::path(config.paths.output_dir) / outcome.name;
    fs::create_directories(out_dir);
    OutputDirectory out(out_dir.string());
    UnionStore group_union((out_dir / (outcome.name + "_union.csv")).string());
    OverviewTable group_overview((out_dir / (outcome.name + "_overview.csv")).string());
    group_overview.load();

    log.info("Processing allele directory: " + outcome.name);
    for (const auto& path : find_peptide_files(group_dir.string(), config.all_files)) {
        FileOutcome fo;
        PipelineConfig pc = config.pipeline;
        pc.assume_cotransduced = false;
        if (const ManifestEntry* entry = manifest.find(path)) {
            pc.cotransduced_patterns = entry->cotransduced;
        } else {
            log.warn("No manifest entry for " + path + ", skipping co-transduced search");
            pc.cotransduced_patterns.clear();
        }
        log.detail("Processing " + path + " with co-transduced: " + pc.cotransduced_patterns);

        try {
            PeptideTable table = read_peptide_table(path);
            for (const auto& w : table.warnings) log.warn(w);
            RunResult result = run_pipeline(table, pc, &out);
            fo.allele = result.metadata.hla_allele;
            fo.classified = std::move(result.classified);
            fo.overview = std::move(result.overview);
            fo.ok = true;
        } catch (const std::exception& e) {
            log.error(path + ": " + e.what());
        }

        if (fo.ok) {
            group_overview.append(fo.overview);
            group_union.merge(fo.classified, fo.allele);
        }
        outcome.files.push_back(std::move(fo));
    }
    group_overview.save();
    log.info(outcome.name + " allele union table saved");
    return outcome;
}

}  // namespace

BulkReport run_bulk(const BulkConfig& config) {
    auto& log = log_utils::Log::instance();
    if (!fs::is_directory(config.bulk_dir)) {
        throw ManifestError("Invalid bulk directory: " + config.bulk_dir);
    }
    const Manifest manifest = read_manifest(config.manifest_path);

    const auto& skip = audit_directory_names();
    std::vector<fs::path> groups;
    for (const auto& entry : fs::directory_iterator(config.bulk_dir)) {
        const std::string name = entry.path().filename().string();
        if (!entry.is_directory() || name.empty() || name[0] == '.') continue;
        if (std::find(skip.begin(), skip.end(), name) != skip.end()) continue;
        groups.push_back(entry.path());
    }
    std::sort(groups.begin(), groups.end());

    fs::create_directories(config.paths.output_dir);

#ifdef _OPENMP
    if (config.threads > 0) {
        omp_set_num_threads(config.threads);
    }
#endif

    std::vector<GroupOutcome> outcomes(groups.size());
    const long n_groups = static_cast<long>(groups.size());
    #pragma omp parallel for schedule(dynamic, 1)
    for (long g = 0; g < n_groups; ++g) {
        try {
            outcomes[g] = run_group(groups[g], manifest, config);
        } catch (const std::exception& e) {
            outcomes[g].name = groups[g].filename().string();
            outcomes[g].error = e.what();
        }
    }

    // Global tables are merged after the parallel region, in group order
    BulkReport report;
    report.groups = groups.size();
    UnionStore global_union(config.paths.resolved_union());
    OverviewTable global_overview(config.paths.resolved_overview());
    global_overview.load();
    for (const auto& outcome : outcomes) {
        if (!outcome.error.empty()) {
            log.error("Group " + outcome.name + " failed: " + outcome.error);
        }
        for (const auto& fo : outcome.files) {
            if (!fo.ok) {
                ++report.files_failed;
                continue;
            }
            global_overview.append(fo.overview);
            global_union.merge(fo.classified, fo.allele);
            ++report.files_processed;
        }
    }
    global_overview.save();
    report.union_entries = global_union.load().size();
    log.info("Overall union table saved");
    return report;
}

}  // namespace hlap
