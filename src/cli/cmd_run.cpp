// hlap run: clean PeptideGroups tables, classify co-transduced peptides and
// fold each run into the union and overview tables.

#include "subcommand.hpp"
#include "args.hpp"
#include "hlap/log_utils.hpp"
#include "hlap/pipeline.hpp"
#include "hlap/version.h"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace hlap {
namespace cli {

int cmd_run(int argc, char* argv[]) {
    RunOptions opts;
    try {
        opts = parse_run_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != kExitOk) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'hlap run --help' for usage.\n";
        }
        return e.exit_code();
    }

    auto& log = log_utils::Log::instance();
    log.set_verbose(opts.verbose);
    auto t_start = std::chrono::steady_clock::now();

    try {
        PipelineConfig config = make_pipeline_config(opts);
        config.cotransduced_patterns = opts.cotransduced;
        config.assume_cotransduced = opts.assume_cotransduced;
        const OutputPaths paths = make_output_paths(opts);

        if (opts.verbose) {
            std::cerr << "HLA-Pipeline v" << HLAP_VERSION << "\n";
            std::cerr << "Input: " << opts.input << "\n";
            std::cerr << "Output: " << paths.output_dir << "\n";
            std::cerr << "Union table: " << paths.resolved_union() << "\n";
            std::cerr << "Overview table: " << paths.resolved_overview() << "\n";
            std::cerr << "Fragment scope: " << fragment_scope_name(config.filter.fragment.scope) << "\n";
            if (!config.cotransduced_patterns.empty()) {
                std::cerr << "Co-transduced patterns: " << config.cotransduced_patterns << "\n";
            }
            std::cerr << "\n";
        }

        const auto files = find_peptide_files(opts.input, opts.all_files);
        if (files.empty()) {
            std::cerr << "Error: no PeptideGroups files found under " << opts.input << "\n";
            return kExitFailure;
        }

        RunReport report = run_files(files, config, paths, opts.allele);

        log.info("Union file saved (" + std::to_string(report.union_entries) + " peptides)");
        log.info("Overview table saved as " + paths.resolved_overview());
        log.info("Processed " + std::to_string(report.files_processed) + " file(s), " +
                 std::to_string(report.files_failed) + " failed in " +
                 log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()));
        return exit_status_for(report.files_failed);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitFailure;
    }
}

}  // namespace cli
}  // namespace hlap
