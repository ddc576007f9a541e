#ifndef HLAP_CLI_ARGS_HPP
#define HLAP_CLI_ARGS_HPP

#include "hlap/pipeline.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace hlap {
namespace cli {

// Exit status of every hlap command
enum ExitStatus : int {
    kExitOk = 0,       // all inputs processed
    kExitFailure = 1,  // usage error or fatal error, nothing trustworthy written
    kExitPartial = 2,  // some input files failed and were skipped
};

// Thrown by the parsers instead of calling exit(): kExitOk for --help,
// kExitFailure for usage errors (message holds the error text).
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// Options shared by `run` and `bulk`
struct CommonOptions {
    std::string output_dir = "hla_files";
    std::string union_file;       // empty: <output>/union_table.csv
    std::string overview_file;    // empty: <output>/final_table.csv
    bool all_files = false;       // also take files not ending in PeptideGroups.txt
    bool skip_cleanup = false;    // all three removal stages
    bool skip_sp = false;
    bool skip_frag = false;
    bool skip_dup = false;
    bool skip_cotransduced = false;
    std::string contaminant_marker = "sp";
    FragmentScope fragment_scope = FragmentScope::SameProtein;
    double rt_tolerance = 0.5;
    int min_fragment_length = 6;
    int max_fragment_length = 22;
    bool verbose = false;
};

struct RunOptions : CommonOptions {
    std::string input = "hla_files";
    std::string cotransduced;          // comma-separated patterns
    bool assume_cotransduced = false;
    std::string allele;                // overrides file name inference
};

struct BulkOptions : CommonOptions {
    std::string manifest;
    std::string bulk_dir;
    int threads = 0;
};

struct InspectOptions {
    std::vector<std::string> files;
    bool tsv = false;
};

void print_run_usage(const char* program_name);
void print_bulk_usage(const char* program_name);
void print_inspect_usage(const char* program_name);

// argv[0] is the subcommand name
RunOptions parse_run_args(int argc, char* argv[]);
BulkOptions parse_bulk_args(int argc, char* argv[]);
InspectOptions parse_inspect_args(int argc, char* argv[]);

// kExitPartial when any file failed, kExitOk otherwise
ExitStatus exit_status_for(size_t files_failed);

PipelineConfig make_pipeline_config(const CommonOptions& opts);
OutputPaths make_output_paths(const CommonOptions& opts);

}  // namespace cli
}  // namespace hlap

#endif  // HLAP_CLI_ARGS_HPP
