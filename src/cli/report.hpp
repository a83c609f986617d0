#ifndef DEGEN_CLI_REPORT_HPP
#define DEGEN_CLI_REPORT_HPP

#include "degen/library.hpp"
#include "degen/synthesizer.hpp"

#include <iosfwd>
#include <vector>

namespace degen {
namespace cli {

// Human-readable per-position block: summary line, amino acid table, categories
void print_position_report(std::ostream& os, const PositionResult& result);

// Library totals and recommendations
void print_library_summary(std::ostream& os, const LibrarySize& size,
                           const std::vector<PositionResult>& results);

// Flattened export table (one row per position and amino acid)
void write_export_tsv(std::ostream& os, const std::vector<ExportRow>& rows);

void print_generator_report(std::ostream& os, const GeneratorResult& result);
void write_generator_tsv(std::ostream& os, const GeneratorResult& result);

}  // namespace cli
}  // namespace degen

#endif  // DEGEN_CLI_REPORT_HPP
