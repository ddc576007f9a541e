#include "subcommand.hpp"
#include "args.hpp"
#include "hlap/version.h"
#include <algorithm>
#include <iostream>
#include <cstring>

namespace hlap {
namespace cli {

const std::vector<Subcommand>& subcommands() {
    static const std::vector<Subcommand> table = {
        {"run", "Clean, classify and aggregate PeptideGroups tables",
         "run -i hla_files --cotransduced \".*HEL.*\"", cmd_run},
        {"bulk", "Process allele directories listed against a manifest",
         "bulk --manifest samples.csv --bulk-dir alleles --threads 4", cmd_bulk},
        {"inspect", "Show metadata inferred from file names",
         "inspect --tsv hla_files/*PeptideGroups.txt", cmd_inspect},
    };
    return table;
}

const Subcommand* find_subcommand(const std::string& name) {
    for (const auto& cmd : subcommands()) {
        if (name == cmd.name) return &cmd;
    }
    return nullptr;
}

void print_usage(const char* program_name) {
    std::cout << "HLA-Pipeline v" << HLAP_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    size_t width = 0;
    for (const auto& cmd : subcommands()) {
        width = std::max(width, std::strlen(cmd.name));
    }
    for (const auto& cmd : subcommands()) {
        std::cout << "  " << cmd.name
                  << std::string(width + 2 - std::strlen(cmd.name), ' ')
                  << cmd.description << "\n";
    }

    std::cout << "\nExit status:\n";
    std::cout << "  " << kExitOk << "  every input file was processed\n";
    std::cout << "  " << kExitFailure << "  usage error or fatal error (bad union table, missing input)\n";
    std::cout << "  " << kExitPartial << "  some input files failed and were skipped\n";

    std::cout << "\nExamples:\n";
    for (const auto& cmd : subcommands()) {
        std::cout << "  " << program_name << " " << cmd.example << "\n";
    }

    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace hlap
