/**
 * @file cmd_library.cpp
 * @brief Combinatorial library analysis: per-position distributions,
 *        total diversity and screening advice.
 */

#include "args.hpp"
#include "report.hpp"
#include "subcommand.hpp"
#include "degen/library.hpp"
#include "degen/log_utils.hpp"
#include "degen/position_io.hpp"

#include <chrono>
#include <iostream>
#include <memory>

namespace degen {
namespace cli {

namespace {

std::unique_ptr<Library> build_library(const Options& opts) {
    if (!opts.input_file.empty()) {
        return std::make_unique<Library>(read_positions(opts.input_file));
    }
    if (opts.codes.empty()) {
        return std::make_unique<Library>();
    }
    std::vector<Position> positions;
    for (const auto& code : opts.codes) {
        const auto ordinal = static_cast<uint32_t>(positions.size() + 1);
        positions.push_back({ordinal, "Position " + std::to_string(ordinal), code});
    }
    return std::make_unique<Library>(std::move(positions));
}

}  // namespace

int cmd_library(int argc, char* argv[]) {
    return run_command(Command::LIBRARY, argc, argv, [](const Options& opts) {
        const auto start = std::chrono::steady_clock::now();

        auto library = build_library(opts);
        log_utils::verbose(opts.verbose, "library",
                           "loaded " + std::to_string(library->size()) + " position(s)");

        const auto results = library->recalculate();
        const LibrarySize size = library->diversity();

        log_utils::verbose(opts.verbose, "library",
                           "diversity " + size.format() + (size.is_exact() ? "" : " (approximate)") +
                           ", computed in " +
                           log_utils::format_elapsed(start, std::chrono::steady_clock::now()));

        return write_output(opts.output_file, [&](std::ostream& os) {
            if (opts.tsv) {
                write_export_tsv(os, export_rows(results));
                return;
            }
            for (const auto& r : results) print_position_report(os, r);
            print_library_summary(os, size, results);
        });
    });
}

namespace {
    struct LibraryRegistrar {
        LibraryRegistrar() {
            SubcommandRegistry::instance().register_command(
                "library",
                "Analyse a multi-position combinatorial library",
                cmd_library, 20);
        }
    };
    static LibraryRegistrar registrar;
}

}  // namespace cli
}  // namespace degen
