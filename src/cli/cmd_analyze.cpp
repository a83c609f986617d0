/**
 * @file cmd_analyze.cpp
 * @brief Amino acid distribution of one or more degenerate codons.
 */

#include "args.hpp"
#include "report.hpp"
#include "subcommand.hpp"
#include "degen/analyzer.hpp"
#include "degen/log_utils.hpp"

#include <chrono>
#include <iostream>

namespace degen {
namespace cli {

int cmd_analyze(int argc, char* argv[]) {
    return run_command(Command::ANALYZE, argc, argv, [](const Options& opts) {
        const auto start = std::chrono::steady_clock::now();

        // Validate every code before printing anything
        std::vector<PositionResult> results;
        uint32_t id = 0;
        for (const auto& code : opts.codes) {
            ++id;
            AnalysisResult analysis = analyze(code);
            results.push_back({{id, analysis.code, analysis.code}, std::move(analysis)});
        }

        log_utils::verbose(opts.verbose, "analyze",
                           "analysed " + std::to_string(results.size()) + " code(s) in " +
                           log_utils::format_elapsed(start, std::chrono::steady_clock::now()));

        return write_output(opts.output_file, [&](std::ostream& os) {
            if (opts.tsv) {
                write_export_tsv(os, export_rows(results));
                return;
            }
            for (const auto& r : results) print_position_report(os, r);
        });
    });
}

namespace {
    struct AnalyzeRegistrar {
        AnalyzeRegistrar() {
            SubcommandRegistry::instance().register_command(
                "analyze",
                "Amino acid distribution of degenerate codons",
                cmd_analyze, 10);
        }
    };
    static AnalyzeRegistrar registrar;
}

}  // namespace cli
}  // namespace degen
