// hlap entry point: dispatch to run, bulk or inspect
//
// Usage:
//   hlap run -i <dir|file> [options]                 Clean, classify and aggregate runs
//   hlap bulk --manifest <csv> --bulk-dir <dir>      Per-allele batch processing
//   hlap inspect <file>...                           Show metadata inferred from file names

#include "subcommand.hpp"
#include "args.hpp"
#include "hlap/version.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    using namespace hlap::cli;

    if (argc < 2) {
        print_usage(argv[0]);
        return kExitFailure;
    }

    const std::string first_arg = argv[1];
    if (first_arg == "--help" || first_arg == "-h") {
        print_usage(argv[0]);
        return kExitOk;
    }
    if (first_arg == "--version" || first_arg == "-V") {
        std::cout << "hlap " << HLAP_VERSION << "\n";
        return kExitOk;
    }

    if (const Subcommand* cmd = find_subcommand(first_arg)) {
        return cmd->fn(argc - 1, argv + 1);
    }

    std::cerr << "Unknown command: " << first_arg << "\n";
    std::cerr << "Run 'hlap --help' for usage information.\n";
    return kExitFailure;
}
