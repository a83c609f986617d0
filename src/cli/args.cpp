#include "args.hpp"
#include "degen/errors.hpp"
#include "degen/version.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace degen {
namespace cli {

const char* command_name(Command cmd) {
    switch (cmd) {
        case Command::ANALYZE: return "analyze";
        case Command::LIBRARY: return "library";
        case Command::DESIGN: return "design";
        default: return "catalog";
    }
}

void print_usage(Command cmd, const char* program_name) {
    std::cout << "degen v" << DEGEN_VERSION << "\n\n";
    switch (cmd) {
        case Command::ANALYZE:
            std::cout << "Usage: " << program_name << " analyze <code> [<code>...] [options]\n\n"
                      << "Amino acid distribution of each degenerate codon (e.g. NNK, NNS, NDT).\n\n";
            break;
        case Command::LIBRARY:
            std::cout << "Usage: " << program_name << " library [<code>...] [-i positions.tsv] [options]\n\n"
                      << "Analyse a combinatorial library. Without codes or -i, uses NNK x 3.\n\n"
                      << "  -i, --input <file>       Position list: '<name>\\t<code>' or '<code>' per line\n"
                      << "                           (plain or .gz, '-' for stdin)\n";
            break;
        case Command::DESIGN:
            std::cout << "Usage: " << program_name << " design <amino-acids> [options]\n\n"
                      << "Find degenerate codons covering a set of amino acids (e.g. 'AG', 'DEKR').\n\n"
                      << "  -s, --strategy <name>    minimal (default), all, or balanced\n";
            break;
        case Command::CATALOG:
            std::cout << "Usage: " << program_name << " catalog [options]\n\n"
                      << "Analyse every 3-letter IUPAC code (3375 codes).\n\n"
                      << "  --covers <amino-acids>   Keep codes encoding all of these\n"
                      << "  --no-stop                Drop codes containing stop codons\n"
                      << "  --max-codons <int>       Keep codes expanding to at most N codons (default: 64)\n"
                      << "  -t, --threads <int>      Number of threads (default: $DEGEN_THREADS or auto)\n";
            break;
    }
    if (cmd != Command::CATALOG) {
        std::cout << "  --tsv                    Write a flat tab-separated table\n";
    }
    std::cout << "  -o, --output <file>      Write to file instead of stdout\n"
              << "  -v, --verbose            Verbose diagnostics on stderr\n"
              << "  -h, --help               Show this help message\n";
}

Options parse_args(Command cmd, int argc, char* argv[]) {
    Options opts;

    if (cmd == Command::CATALOG) {
        if (const char* env = std::getenv("DEGEN_THREADS")) {
            opts.num_threads = std::atoi(env);
            if (opts.num_threads < 0) opts.num_threads = 0;
        }
    }

    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(cmd, "degen");
            throw ParseArgsExit(0);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--tsv" && cmd != Command::CATALOG) {
            opts.tsv = true;
        } else if ((arg == "-i" || arg == "--input") && cmd == Command::LIBRARY) {
            opts.input_file = require_value(arg);
        } else if ((arg == "-s" || arg == "--strategy") && cmd == Command::DESIGN) {
            const std::string name = require_value(arg);
            try {
                opts.strategy = parse_strategy(name);
            } catch (const DegenError& e) {
                throw ParseArgsExit(1, std::string("Error: ") + e.what());
            }
        } else if (arg == "--covers" && cmd == Command::CATALOG) {
            opts.covers = require_value(arg);
        } else if (arg == "--no-stop" && cmd == Command::CATALOG) {
            opts.no_stop = true;
        } else if (arg == "--max-codons" && cmd == Command::CATALOG) {
            opts.max_codons = parse_int(arg, require_value(arg));
            if (opts.max_codons < 1) {
                throw ParseArgsExit(1, "Error: --max-codons must be >= 1");
            }
        } else if ((arg == "-t" || arg == "--threads") && cmd == Command::CATALOG) {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-" && cmd == Command::LIBRARY) {
            opts.input_file = arg;
        } else if (!arg.empty() && arg[0] == '-') {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    switch (cmd) {
        case Command::ANALYZE:
            if (positional.empty()) {
                throw ParseArgsExit(1, "Error: No degenerate codon specified");
            }
            opts.codes = positional;
            break;
        case Command::LIBRARY:
            if (!positional.empty() && !opts.input_file.empty()) {
                throw ParseArgsExit(1, "Error: Give codes or --input, not both");
            }
            opts.codes = positional;
            break;
        case Command::DESIGN:
            if (positional.size() != 1) {
                throw ParseArgsExit(1, "Error: Expected exactly one amino acid string");
            }
            opts.amino_acids = positional.front();
            break;
        case Command::CATALOG:
            if (!positional.empty()) {
                throw ParseArgsExit(1, "Error: Unexpected argument: " + positional.front());
            }
            break;
    }

    return opts;
}

int run_command(Command cmd, int argc, char* argv[],
                const std::function<int(const Options&)>& body) {
    Options opts;
    try {
        opts = parse_args(cmd, argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'degen " << command_name(cmd) << " --help' for usage information.\n";
        }
        return e.exit_code();
    }

    try {
        return body(opts);
    } catch (const DegenError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int write_output(const std::string& path, const std::function<void(std::ostream&)>& writer) {
    if (path.empty() || path == "-") {
        writer(std::cout);
        return 0;
    }
    std::ofstream ofs(path);
    if (!ofs) {
        std::cerr << "Error: Cannot open output file: " << path << "\n";
        return 1;
    }
    writer(ofs);
    return 0;
}

}  // namespace cli
}  // namespace degen
