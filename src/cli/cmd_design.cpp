/**
 * @file cmd_design.cpp
 * @brief Reverse synthesis: degenerate codons covering a target amino acid set.
 */

#include "args.hpp"
#include "report.hpp"
#include "subcommand.hpp"
#include "degen/log_utils.hpp"
#include "degen/synthesizer.hpp"

#include <chrono>
#include <iostream>

namespace degen {
namespace cli {

int cmd_design(int argc, char* argv[]) {
    return run_command(Command::DESIGN, argc, argv, [](const Options& opts) {
        const auto start = std::chrono::steady_clock::now();

        const GeneratorResult result = synthesize(opts.amino_acids, opts.strategy);

        log_utils::verbose(opts.verbose, "design",
                           "target " + result.target.str() + ", strategy " +
                           strategy_to_string(result.strategy) + ": " +
                           std::to_string(result.candidates.size()) + " candidate(s) in " +
                           log_utils::format_elapsed(start, std::chrono::steady_clock::now()));

        return write_output(opts.output_file, [&](std::ostream& os) {
            if (opts.tsv) {
                write_generator_tsv(os, result);
            } else {
                print_generator_report(os, result);
            }
        });
    });
}

namespace {
    struct DesignRegistrar {
        DesignRegistrar() {
            SubcommandRegistry::instance().register_command(
                "design",
                "Find degenerate codons for a target amino acid set",
                cmd_design, 30);
        }
    };
    static DesignRegistrar registrar;
}

}  // namespace cli
}  // namespace degen
