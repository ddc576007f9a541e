/**
 * @file cmd_inspect.cpp
 * @brief Show the metadata hlap infers from PeptideGroups file names.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "hlap/cotransduction.hpp"
#include "hlap/peptide_table.hpp"

#include <iostream>
#include <string>

namespace hlap {
namespace cli {

int cmd_inspect(int argc, char* argv[]) {
    InspectOptions opts;
    try {
        opts = parse_inspect_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != kExitOk) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'hlap inspect --help' for usage.\n";
        }
        return e.exit_code();
    }

    if (opts.tsv) std::cout << "file_name\tbase_name\tdate_created\tHLA_allele\tco-transduced\n";
    for (const auto& f : opts.files) {
        const RunMetadata meta = describe_file(f);
        const auto pattern = infer_pattern_from_filename(f);
        if (opts.tsv) {
            std::cout << meta.file_name << '\t' << meta.base_name << '\t' << meta.date_created
                      << '\t' << meta.hla_allele << '\t' << pattern.value_or("") << '\n';
        } else {
            std::cout << meta.file_name << "\n"
                      << "  base name:      " << meta.base_name << "\n"
                      << "  date created:   " << meta.date_created << "\n"
                      << "  HLA allele:     " << (meta.hla_allele.empty() ? "(unknown)" : meta.hla_allele) << "\n"
                      << "  co-transduced:  " << pattern.value_or("(none)") << "\n";
        }
    }
    return kExitOk;
}

}  // namespace cli
}  // namespace hlap
