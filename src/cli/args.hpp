#ifndef DEGEN_CLI_ARGS_HPP
#define DEGEN_CLI_ARGS_HPP

#include "degen/synthesizer.hpp"

#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace degen {
namespace cli {

enum class Command {
    ANALYZE,
    LIBRARY,
    DESIGN,
    CATALOG
};

struct Options {
    std::vector<std::string> codes;   // positional degenerate codons
    std::string input_file;           // library: position list (plain or .gz, "-" = stdin)
    std::string output_file;          // empty = stdout
    std::string amino_acids;          // design: target set
    Strategy strategy = Strategy::MINIMAL;
    std::string covers;               // catalog: amino acids every code must encode
    bool no_stop = false;             // catalog: drop codes with stop codons
    int max_codons = 64;              // catalog: expansion size limit
    int num_threads = 0;              // 0 = DEGEN_THREADS or OpenMP default
    bool tsv = false;                 // flattened table instead of report
    bool verbose = false;
};

// Thrown by parse_args for --help (code 0) and usage errors (code 1)
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(code) {}

    int exit_code() const noexcept { return exit_code_; }

private:
    int exit_code_;
};

const char* command_name(Command cmd);

// Print usage/help for one subcommand to stdout
void print_usage(Command cmd, const char* program_name);

// Parse subcommand arguments (argv[0] is the subcommand name)
Options parse_args(Command cmd, int argc, char* argv[]);

// Parse, then run `body`. ParseArgsExit and DegenError become exit codes.
int run_command(Command cmd, int argc, char* argv[],
                const std::function<int(const Options&)>& body);

// Write to `path`, or stdout when empty. Returns 1 if the file cannot be opened.
int write_output(const std::string& path, const std::function<void(std::ostream&)>& writer);

}  // namespace cli
}  // namespace degen

#endif  // DEGEN_CLI_ARGS_HPP
