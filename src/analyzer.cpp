#include "degen/analyzer.hpp"
#include "degen/codon_tables.hpp"
#include "degen/expander.hpp"

#include <algorithm>
#include <array>

namespace degen {

namespace {

// Translate every codon and count per symbol, first-seen order
std::vector<std::pair<char, int>> count_translations(const std::vector<Codon>& codons) {
    std::array<int, 128> slot;
    slot.fill(-1);
    std::vector<std::pair<char, int>> counts;
    counts.reserve(21);

    for (const Codon& c : codons) {
        const char aa = translate(c);
        const auto key = static_cast<unsigned char>(aa);
        if (slot[key] < 0) {
            slot[key] = static_cast<int>(counts.size());
            counts.emplace_back(aa, 0);
        }
        ++counts[static_cast<size_t>(slot[key])].second;
    }
    return counts;
}

}  // namespace

int AnalysisResult::count_of(char aa) const {
    for (const auto& a : amino_acids) {
        if (a.aa == aa) return a.count;
    }
    return 0;
}

double AnalysisResult::frequency_of(char aa) const {
    for (const auto& a : amino_acids) {
        if (a.aa == aa) return a.frequency;
    }
    return 0.0;
}

AnalysisResult analyze(const DegenerateCodon& code) {
    const auto codons = expand(code);
    const auto counts = count_translations(codons);

    AnalysisResult result;
    result.code = code.str();
    result.total_codons = static_cast<int>(codons.size());
    result.unique_amino_acids = static_cast<int>(counts.size());

    const double total = static_cast<double>(result.total_codons);
    result.amino_acids.reserve(counts.size());
    for (const auto& [aa, n] : counts) {
        result.amino_acids.push_back({aa, n, n / total * 100.0});
    }

    // Stable: equal frequencies keep accumulation order
    std::stable_sort(result.amino_acids.begin(), result.amino_acids.end(),
                     [](const AminoAcidCount& a, const AminoAcidCount& b) {
                         return a.frequency > b.frequency;
                     });

    const int stops = result.count_of(STOP_SYMBOL);
    result.has_stop = stops > 0;
    result.stop_frequency = result.has_stop ? stops / total * 100.0 : 0.0;

    // Category totals in first-seen order over the accumulation
    for (const auto& [aa, n] : counts) {
        const auto category = category_of(aa);
        if (!category) continue;
        auto it = std::find_if(result.properties.begin(), result.properties.end(),
                               [&](const PropertyFrequency& p) { return p.property == *category; });
        if (it == result.properties.end()) {
            result.properties.push_back({*category, 0.0});
            it = result.properties.end() - 1;
        }
        it->frequency += n / total * 100.0;
    }

    return result;
}

AnalysisResult analyze(const std::string& code) {
    return analyze(DegenerateCodon::parse(code));
}

TargetSet::TargetSet(const std::string& symbols) {
    for (char c : symbols) {
        const char aa = fast_upper(c);
        if (!is_standard_amino_acid(aa)) continue;
        if (symbols_.find(aa) == std::string::npos) symbols_ += aa;
    }
    std::sort(symbols_.begin(), symbols_.end());
}

bool TargetSet::contains(char aa) const {
    return symbols_.find(aa) != std::string::npos;
}

Evaluation evaluate(const DegenerateCodon& code, const TargetSet& target) {
    const auto codons = expand(code);

    Evaluation eval;
    eval.code = code.str();
    eval.total_codons = static_cast<int>(codons.size());
    eval.amino_acid_counts = count_translations(codons);

    for (const auto& [aa, n] : eval.amino_acid_counts) {
        if (aa == STOP_SYMBOL) {
            eval.stop_count = n;
        } else if (!target.contains(aa)) {
            eval.extra_amino_acids += aa;
        }
    }
    for (char aa : target) {
        const bool present = std::any_of(eval.amino_acid_counts.begin(), eval.amino_acid_counts.end(),
                                         [aa](const std::pair<char, int>& p) { return p.first == aa; });
        if (!present) eval.missing_amino_acids += aa;
    }
    if (eval.total_codons > 0) {
        eval.stop_frequency = static_cast<double>(eval.stop_count) / eval.total_codons * 100.0;
    }
    return eval;
}

}  // namespace degen
