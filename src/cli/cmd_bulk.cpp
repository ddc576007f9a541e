// hlap bulk: one union/overview table per allele directory plus global ones,
// with co-transduced patterns taken from a manifest CSV.

#include "subcommand.hpp"
#include "args.hpp"
#include "hlap/log_utils.hpp"
#include "hlap/pipeline.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace hlap {
namespace cli {

int cmd_bulk(int argc, char* argv[]) {
    BulkOptions opts;
    try {
        opts = parse_bulk_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != kExitOk) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'hlap bulk --help' for usage.\n";
        }
        return e.exit_code();
    }

    auto& log = log_utils::Log::instance();
    log.set_verbose(opts.verbose);
    auto t_start = std::chrono::steady_clock::now();

    try {
        BulkConfig config;
        config.pipeline = make_pipeline_config(opts);
        config.manifest_path = opts.manifest;
        config.bulk_dir = opts.bulk_dir;
        config.paths = make_output_paths(opts);
        config.all_files = opts.all_files;
        config.threads = opts.threads;

        log.info("Bulk processing mode");
        BulkReport report = run_bulk(config);

        log.info("Processed " + std::to_string(report.groups) + " group(s), " +
                 std::to_string(report.files_processed) + " file(s), " +
                 std::to_string(report.files_failed) + " failed in " +
                 log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()));
        log.info("Union table: " + config.paths.resolved_union() + " (" +
                 std::to_string(report.union_entries) + " peptides)");
        return exit_status_for(report.files_failed);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitFailure;
    }
}

}  // namespace cli
}  // namespace hlap
