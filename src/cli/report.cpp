#include "report.hpp"
#include "degen/codon_tables.hpp"

#include <iomanip>
#include <ostream>
#include <string>

namespace degen {
namespace cli {

namespace {

std::string counts_to_string(const std::vector<std::pair<char, int>>& counts) {
    std::string out;
    for (const auto& [aa, n] : counts) {
        if (!out.empty()) out += ',';
        out += aa;
        out += ':';
        out += std::to_string(n);
    }
    return out;
}

std::string or_dash(const std::string& s) {
    return s.empty() ? "-" : s;
}

}  // namespace

void print_position_report(std::ostream& os, const PositionResult& result) {
    const auto& a = result.analysis;
    os << "=== " << result.position.name << " ===\n";
    os << "Degenerate codon:   " << a.code << "\n";
    os << "Possible codons:    " << a.total_codons << "\n";
    os << "Unique amino acids: " << a.unique_amino_acids << "\n";
    if (a.has_stop) {
        os << std::fixed << std::setprecision(1);
        os << "WARNING: stop codons " << a.stop_frequency << "%\n";
    }
    os << "\n";

    os << std::left
       << std::setw(4) << "AA" << std::setw(15) << "Name"
       << std::right << std::setw(10) << "Freq(%)" << std::setw(9) << "Count"
       << "  " << std::left << std::setw(10) << "Category"
       << std::setw(19) << "Charge" << std::setw(16) << "Polarity" << "Size\n";

    for (const auto& aa : a.amino_acids) {
        const auto& info = amino_acid_info(aa.aa);
        const auto category = category_of(aa.aa);
        const std::string count = std::to_string(aa.count) + "/" + std::to_string(a.total_codons);
        os << std::left << std::setw(4) << aa.aa << std::setw(15) << info.name
           << std::right << std::fixed << std::setprecision(1) << std::setw(10) << aa.frequency
           << std::setw(9) << count
           << "  " << std::left << std::setw(10) << (category ? property_to_string(*category) : "-")
           << std::setw(19) << info.charge << std::setw(16) << info.polarity << info.size << "\n";
    }

    if (!a.properties.empty()) {
        os << "\nCategories:";
        for (const auto& p : a.properties) {
            os << " " << property_to_string(p.property) << "=" << std::fixed
               << std::setprecision(1) << p.frequency << "%";
        }
        os << "\n";
    }
    os << std::right << "\n";
}

void print_library_summary(std::ostream& os, const LibrarySize& size,
                           const std::vector<PositionResult>& results) {
    os << "--- Library Summary ---\n";
    os << "Total positions:            " << results.size() << "\n";
    os << "Library size:               " << size.format() << " variants\n";
    os << "Positions with stop codons: " << positions_with_stop(results).size() << "\n\n";
    os << "Recommendations:\n";
    for (const auto& r : recommendations(size, results)) {
        os << "  - " << r << "\n";
    }
}

void write_export_tsv(std::ostream& os, const std::vector<ExportRow>& rows) {
    os << "position\tposition_name\tdegenerate_codon\tamino_acid\taa_name\tfrequency_pct"
          "\tcount\ttotal_codons\tcategory\tcharge\tpolarity\tsize\n";
    for (const auto& r : rows) {
        os << r.position_index << '\t' << r.position_name << '\t' << r.codon << '\t'
           << r.aa << '\t' << r.aa_name << '\t'
           << std::fixed << std::setprecision(2) << r.frequency << '\t'
           << r.count << '\t' << r.total_codons << '\t' << or_dash(r.category) << '\t'
           << r.charge << '\t' << r.polarity << '\t' << r.size << '\n';
    }
}

void print_generator_report(std::ostream& os, const GeneratorResult& result) {
    os << "=== Codon design: " << result.target.str() << " (" << strategy_to_string(result.strategy)
       << ") ===\n";
    os << "Candidates: " << result.candidates.size() << "\n\n";

    os << std::left << std::setw(7) << "Code" << std::right << std::setw(8) << "Codons"
       << std::setw(9) << "Stop(%)" << "  " << std::left << std::setw(12) << "Extra AAs"
       << std::setw(10) << "Missing" << "Amino acid counts\n";

    for (const auto& c : result.candidates) {
        const auto& e = c.evaluation;
        os << std::left << std::setw(7) << e.code << std::right << std::setw(8) << e.total_codons
           << std::fixed << std::setprecision(2) << std::setw(9) << e.stop_frequency
           << "  " << std::left << std::setw(12) << or_dash(e.extra_amino_acids)
           << std::setw(10) << or_dash(e.missing_amino_acids)
           << counts_to_string(e.amino_acid_counts) << "\n";
    }
    os << std::right;
}

void write_generator_tsv(std::ostream& os, const GeneratorResult& result) {
    os << "rank\tcode\ttarget\tstrategy\ttotal_codons\tstop_pct\textra_amino_acids"
          "\tmissing_amino_acids\tamino_acid_counts\n";
    size_t rank = 0;
    for (const auto& c : result.candidates) {
        const auto& e = c.evaluation;
        os << ++rank << '\t' << e.code << '\t' << result.target.str() << '\t'
           << strategy_to_string(result.strategy) << '\t' << e.total_codons << '\t'
           << std::fixed << std::setprecision(2) << e.stop_frequency << '\t'
           << or_dash(e.extra_amino_acids) << '\t' << or_dash(e.missing_amino_acids) << '\t'
           << counts_to_string(e.amino_acid_counts) << '\n';
    }
}

}  // namespace cli
}  // namespace degen
