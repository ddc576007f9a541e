#include "args.hpp"
#include <iostream>
#include <string>

namespace hlap {
namespace cli {

namespace {

void print_common_usage() {
    std::cout << "  -o, --output <dir>        Output directory (default: hla_files)\n";
    std::cout << "  -u, --union <file>        Union table (default: <output>/union_table.csv)\n";
    std::cout << "  -t, --overview <file>     Overview table (default: <output>/final_table.csv)\n";
    std::cout << "  --all-files               Process every file, not only *PeptideGroups.txt\n";
    std::cout << "\nCleanup:\n";
    std::cout << "  --skip-cleanup            Skip contaminant, fragment and duplicate removal\n";
    std::cout << "  --skip-sp                 Skip contaminant (sp) removal\n";
    std::cout << "  --skip-frag               Skip fragment removal\n";
    std::cout << "  --skip-dup                Skip duplicate removal\n";
    std::cout << "  --contaminant-tag <tag>   Accession tag marking contaminants (default: sp)\n";
    std::cout << "  --fragment-scope <s>      protein (shared accession) or global (default: protein)\n";
    std::cout << "  --rt-tolerance <min>      Max RT difference for fragments, 0 = off (default: 0.5)\n";
    std::cout << "  --fragment-min <int>      Shortest peptide tested as fragment (default: 6)\n";
    std::cout << "  --fragment-max <int>      Longest peptide tested as fragment (default: 22)\n";
    std::cout << "\nCo-transduced peptides:\n";
    std::cout << "  --skip-cotransduced       Do not classify co-transduced peptides\n";
}

// Shared flag handling. Returns false when `arg` is not a common option.
template <typename NextValue, typename ParseInt, typename ParseDouble>
bool parse_common(const std::string& arg, CommonOptions& opts, NextValue&& next,
                  ParseInt&& parse_int, ParseDouble&& parse_double) {
    if (arg == "-o" || arg == "--output") {
        opts.output_dir = next(arg);
    } else if (arg == "-u" || arg == "--union") {
        opts.union_file = next(arg);
    } else if (arg == "-t" || arg == "--overview") {
        opts.overview_file = next(arg);
    } else if (arg == "--all-files" || arg == "--peptide") {
        opts.all_files = true;
    } else if (arg == "--skip-cleanup") {
        opts.skip_cleanup = true;
    } else if (arg == "--skip-sp") {
        opts.skip_sp = true;
    } else if (arg == "--skip-frag") {
        opts.skip_frag = true;
    } else if (arg == "--skip-dup") {
        opts.skip_dup = true;
    } else if (arg == "--skip-cotransduced") {
        opts.skip_cotransduced = true;
    } else if (arg == "--contaminant-tag") {
        opts.contaminant_marker = next(arg);
        if (opts.contaminant_marker.empty()) {
            throw ParseArgsExit(kExitFailure, "Error: --contaminant-tag must not be empty");
        }
    } else if (arg == "--fragment-scope") {
        const std::string scope = next(arg);
        if (scope == "protein") {
            opts.fragment_scope = FragmentScope::SameProtein;
        } else if (scope == "global") {
            opts.fragment_scope = FragmentScope::Global;
        } else {
            throw ParseArgsExit(kExitFailure, "Error: Unknown fragment scope '" + scope + "'");
        }
    } else if (arg == "--rt-tolerance") {
        opts.rt_tolerance = parse_double(arg, next(arg));
        if (opts.rt_tolerance < 0.0) {
            throw ParseArgsExit(kExitFailure, "Error: --rt-tolerance must be >= 0");
        }
    } else if (arg == "--fragment-min") {
        opts.min_fragment_length = parse_int(arg, next(arg));
        if (opts.min_fragment_length < 1) {
            throw ParseArgsExit(kExitFailure, "Error: --fragment-min must be >= 1");
        }
    } else if (arg == "--fragment-max") {
        opts.max_fragment_length = parse_int(arg, next(arg));
    } else if (arg == "-v" || arg == "--verbose") {
        opts.verbose = true;
    } else {
        return false;
    }
    return true;
}

void validate_common(const CommonOptions& opts) {
    if (opts.max_fragment_length < opts.min_fragment_length) {
        throw ParseArgsExit(kExitFailure, "Error: --fragment-max must be >= --fragment-min");
    }
}

}  // namespace

void print_run_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " run -i <dir|file> [options]\n\n";
    std::cout << "Clean PeptideGroups tables, classify co-transduced peptides and\n";
    std::cout << "update the union and overview tables.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -i, --input <path>        Input file or directory (default: hla_files)\n";
    print_common_usage();
    std::cout << "  --cotransduced <list>     Comma-separated patterns (regular expressions)\n";
    std::cout << "  --assume-cotransduced     Add the protein named in the file name as a pattern\n";
    std::cout << "  --allele <name>           HLA allele for all inputs (default: from file name)\n";
    std::cout << "\n";
    std::cout << "  -v, --verbose             Verbose output\n";
    std::cout << "  -h, --help                Show this help message\n";
}

void print_bulk_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " bulk --manifest <csv> --bulk-dir <dir> [options]\n\n";
    std::cout << "Process every allele sub-directory of --bulk-dir, taking co-transduced\n";
    std::cout << "patterns from the manifest (columns HLA_allele, file_name,\n";
    std::cout << "co-transduced protein(s)).\n\n";
    std::cout << "Options:\n";
    std::cout << "  --manifest <csv>          Manifest table (required)\n";
    std::cout << "  --bulk-dir <dir>          Directory of allele sub-directories (required)\n";
    print_common_usage();
    std::cout << "\n";
    std::cout << "  --threads <int>           Groups processed in parallel (default: auto)\n";
    std::cout << "  -v, --verbose             Verbose output\n";
    std::cout << "  -h, --help                Show this help message\n";
}

void print_inspect_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " inspect <file>... [options]\n\n";
    std::cout << "Print base name, date, HLA allele and the inferred co-transduced\n";
    std::cout << "pattern for each file name.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --tsv                     Tab-separated output with a header line\n";
    std::cout << "  -h, --help                Show this help message\n";
}

namespace {

struct ValueParsers {
    int argc;
    char** argv;
    int& i;

    std::string next(const std::string& flag) {
        if (i + 1 >= argc) {
            throw ParseArgsExit(kExitFailure, "Error: Missing value for " + flag);
        }
        return argv[++i];
    }

    static int to_int(const std::string& flag, const std::string& value) {
        try {
            size_t idx = 0;
            int parsed = std::stoi(value, &idx);
            if (idx != value.size()) {
                throw ParseArgsExit(kExitFailure, "Error: Invalid integer for " + flag + ": " + value);
            }
            return parsed;
        } catch (const ParseArgsExit&) {
            throw;
        } catch (const std::exception&) {
            throw ParseArgsExit(kExitFailure, "Error: Invalid integer for " + flag + ": " + value);
        }
    }

    static double to_double(const std::string& flag, const std::string& value) {
        try {
            size_t idx = 0;
            double parsed = std::stod(value, &idx);
            if (idx != value.size()) {
                throw ParseArgsExit(kExitFailure, "Error: Invalid number for " + flag + ": " + value);
            }
            return parsed;
        } catch (const ParseArgsExit&) {
            throw;
        } catch (const std::exception&) {
            throw ParseArgsExit(kExitFailure, "Error: Invalid number for " + flag + ": " + value);
        }
    }
};

}  // namespace

RunOptions parse_run_args(int argc, char* argv[]) {
    RunOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        ValueParsers vp{argc, argv, i};
        auto next = [&](const std::string& flag) { return vp.next(flag); };

        if (arg == "-h" || arg == "--help") {
            print_run_usage("hlap");
            throw ParseArgsExit(kExitOk);
        } else if (parse_common(arg, opts, next, ValueParsers::to_int, ValueParsers::to_double)) {
            continue;
        } else if (arg == "-i" || arg == "--input") {
            opts.input = next(arg);
        } else if (arg == "--cotransduced") {
            opts.cotransduced = next(arg);
        } else if (arg == "--assume-cotransduced") {
            opts.assume_cotransduced = true;
        } else if (arg == "--allele") {
            opts.allele = next(arg);
        } else {
            throw ParseArgsExit(kExitFailure, "Error: Unknown option: " + arg);
        }
    }

    if (opts.input.empty()) {
        throw ParseArgsExit(kExitFailure, "Error: No input specified");
    }
    validate_common(opts);
    return opts;
}

BulkOptions parse_bulk_args(int argc, char* argv[]) {
    BulkOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        ValueParsers vp{argc, argv, i};
        auto next = [&](const std::string& flag) { return vp.next(flag); };

        if (arg == "-h" || arg == "--help") {
            print_bulk_usage("hlap");
            throw ParseArgsExit(kExitOk);
        } else if (parse_common(arg, opts, next, ValueParsers::to_int, ValueParsers::to_double)) {
            continue;
        } else if (arg == "--manifest" || arg == "-bulkcsv") {
            opts.manifest = next(arg);
        } else if (arg == "--bulk-dir" || arg == "-bulkdir") {
            opts.bulk_dir = next(arg);
        } else if (arg == "--threads") {
            opts.threads = ValueParsers::to_int(arg, next(arg));
            if (opts.threads < 1) {
                throw ParseArgsExit(kExitFailure, "Error: --threads must be >= 1");
            }
        } else {
            throw ParseArgsExit(kExitFailure, "Error: Unknown option: " + arg);
        }
    }

    if (opts.manifest.empty() || opts.bulk_dir.empty()) {
        throw ParseArgsExit(kExitFailure, "Error: --manifest and --bulk-dir are required");
    }
    validate_common(opts);
    return opts;
}

InspectOptions parse_inspect_args(int argc, char* argv[]) {
    InspectOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_inspect_usage("hlap");
            throw ParseArgsExit(kExitOk);
        } else if (arg == "--tsv") {
            opts.tsv = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw ParseArgsExit(kExitFailure, "Error: Unknown option: " + arg);
        } else {
            opts.files.push_back(arg);
        }
    }

    if (opts.files.empty()) {
        throw ParseArgsExit(kExitFailure, "Error: No files specified");
    }
    return opts;
}

ExitStatus exit_status_for(size_t files_failed) {
    return files_failed == 0 ? kExitOk : kExitPartial;
}

PipelineConfig make_pipeline_config(const CommonOptions& opts) {
    PipelineConfig config;
    config.filter.skip_contaminant_removal = opts.skip_cleanup || opts.skip_sp;
    config.filter.skip_fragment_removal = opts.skip_cleanup || opts.skip_frag;
    config.filter.skip_duplicate_removal = opts.skip_cleanup || opts.skip_dup;
    config.filter.contaminant_marker = opts.contaminant_marker;
    config.filter.fragment.scope = opts.fragment_scope;
    config.filter.fragment.rt_tolerance = opts.rt_tolerance;
    config.filter.fragment.min_length = opts.min_fragment_length;
    config.filter.fragment.max_length = opts.max_fragment_length;
    config.skip_cotransduction = opts.skip_cotransduced;
    return config;
}

OutputPaths make_output_paths(const CommonOptions& opts) {
    OutputPaths paths;
    paths.output_dir = opts.output_dir;
    paths.union_path = opts.union_file;
    paths.overview_path = opts.overview_file;
    return paths;
}

}  // namespace cli
}  // namespace hlap
