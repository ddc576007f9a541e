#ifndef HLAP_CLI_SUBCOMMAND_HPP
#define HLAP_CLI_SUBCOMMAND_HPP

#include <string>
#include <vector>

namespace hlap {
namespace cli {

// argv[0] is the subcommand name; returns an ExitStatus
using SubcommandFn = int (*)(int argc, char* argv[]);

struct Subcommand {
    const char* name;
    const char* description;
    const char* example;
    SubcommandFn fn;
};

// Subcommands in workflow order
const std::vector<Subcommand>& subcommands();

// nullptr for unknown names
const Subcommand* find_subcommand(const std::string& name);

// Top-level help: commands, exit status and examples
void print_usage(const char* program_name);

int cmd_run(int argc, char* argv[]);
int cmd_bulk(int argc, char* argv[]);
int cmd_inspect(int argc, char* argv[]);

}  // namespace cli
}  // namespace hlap

#endif  // HLAP_CLI_SUBCOMMAND_HPP
