// Main entry point for the degen CLI with subcommand dispatch
//
// Usage:
//   degen analyze NNK NDT            Amino acid distribution per code
//   degen library -i positions.tsv   Combinatorial library size and content
//   degen design DEKR -s balanced    Degenerate codons for a target set
//   degen catalog --covers AG        Search every 3-letter IUPAC code
//   degen iupac                      IUPAC code reference

#include "subcommand.hpp"
#include "degen/version.h"

#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    auto& registry = degen::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }

    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "degen " << DEGEN_VERSION << "\n";
        return 0;
    }

    return registry.run_command(first_arg, argc - 1, argv + 1);
}
