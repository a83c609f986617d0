/**
 * @file cmd_catalog.cpp
 * @brief Analyse every 3-letter IUPAC code and list those matching filters.
 *
 * With --covers the list is ordered by off-target amino acids, then stop
 * frequency, then expansion size, so the most specific codes come first.
 */

#include "args.hpp"
#include "subcommand.hpp"
#include "degen/analyzer.hpp"
#include "degen/codon_tables.hpp"
#include "degen/log_utils.hpp"
#include "degen/synthesizer.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace degen {
namespace cli {

namespace {

struct CatalogEntry {
    AnalysisResult analysis;
    Evaluation evaluation;
};

std::string symbols_of(const AnalysisResult& a) {
    std::string out;
    for (const auto& aa : a.amino_acids) out += aa.aa;
    return out;
}

}  // namespace

int cmd_catalog(int argc, char* argv[]) {
    return run_command(Command::CATALOG, argc, argv, [](const Options& opts) {
        const auto start = std::chrono::steady_clock::now();

        TargetSet covers;
        if (!opts.covers.empty()) covers = parse_target(opts.covers);

        const auto& table = iupac_table();
        const int n_codes = static_cast<int>(table.size());
        const int total = n_codes * n_codes * n_codes;

#ifdef _OPENMP
        if (opts.num_threads > 0) omp_set_num_threads(opts.num_threads);
        log_utils::verbose(opts.verbose, "catalog",
                           "using " + std::to_string(omp_get_max_threads()) + " thread(s)");
#endif

        std::vector<CatalogEntry> entries(static_cast<size_t>(total));

        #pragma omp parallel for schedule(dynamic, 64)
        for (int i = 0; i < total; ++i) {
            const auto& p1 = table[static_cast<size_t>(i / (n_codes * n_codes))];
            const auto& p2 = table[static_cast<size_t>((i / n_codes) % n_codes)];
            const auto& p3 = table[static_cast<size_t>(i % n_codes)];
            const auto code = DegenerateCodon::from_sets(p1.bases, p2.bases, p3.bases);
            entries[static_cast<size_t>(i)] = {analyze(code), evaluate(code, covers)};
        }

        std::vector<const CatalogEntry*> kept;
        for (const auto& e : entries) {
            if (e.analysis.total_codons > opts.max_codons) continue;
            if (opts.no_stop && e.analysis.has_stop) continue;
            if (!covers.empty() && !e.evaluation.covers_target()) continue;
            kept.push_back(&e);
        }

        if (!covers.empty()) {
            std::stable_sort(kept.begin(), kept.end(), [](const CatalogEntry* a, const CatalogEntry* b) {
                if (a->evaluation.extra_count() != b->evaluation.extra_count()) {
                    return a->evaluation.extra_count() < b->evaluation.extra_count();
                }
                if (a->analysis.stop_frequency != b->analysis.stop_frequency) {
                    return a->analysis.stop_frequency < b->analysis.stop_frequency;
                }
                return a->analysis.total_codons < b->analysis.total_codons;
            });
        }

        log_utils::verbose(opts.verbose, "catalog",
                           std::to_string(kept.size()) + " of " + std::to_string(total) +
                           " codes kept in " +
                           log_utils::format_elapsed(start, std::chrono::steady_clock::now()));

        return write_output(opts.output_file, [&](std::ostream& os) {
            os << "code\ttotal_codons\tunique_amino_acids\tstop_pct\tamino_acids";
            if (!covers.empty()) os << "\textra_amino_acids";
            os << "\n";
            for (const CatalogEntry* e : kept) {
                const auto& a = e->analysis;
                os << a.code << '\t' << a.total_codons << '\t' << a.unique_amino_acids << '\t'
                   << std::fixed << std::setprecision(2) << a.stop_frequency << '\t'
                   << symbols_of(a);
                if (!covers.empty()) {
                    os << '\t' << (e->evaluation.extra_amino_acids.empty() ? "-" : e->evaluation.extra_amino_acids);
                }
                os << '\n';
            }
        });
    });
}

namespace {
    struct CatalogRegistrar {
        CatalogRegistrar() {
            SubcommandRegistry::instance().register_command(
                "catalog",
                "Search every 3-letter IUPAC code",
                cmd_catalog, 40);
        }
    };
    static CatalogRegistrar registrar;
}

}  // namespace cli
}  // namespace degen
