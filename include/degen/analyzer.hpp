#pragma once
// Forward analysis of one degenerate codon and evaluation of a candidate
// code against a target amino acid set.
//
// All counts are accumulated in first-seen order over the expansion
// (A < C < G < T, last position fastest); sorting by frequency is stable, so
// ties keep that order.

#include "degen/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace degen {

struct AminoAcidCount {
    char aa;
    int count = 0;
    double frequency = 0.0;  // percent of total_codons
};

struct PropertyFrequency {
    AminoAcidProperty property;
    double frequency = 0.0;  // percent, sum over member amino acids
};

struct AnalysisResult {
    std::string code;                         // normalised (upper-case)
    int total_codons = 0;
    int unique_amino_acids = 0;               // stop counted as a symbol
    std::vector<AminoAcidCount> amino_acids;  // descending frequency
    bool has_stop = false;
    double stop_frequency = 0.0;              // 0 when has_stop is false
    std::vector<PropertyFrequency> properties;  // non-empty categories only

    int count_of(char aa) const;
    double frequency_of(char aa) const;
};

// Throws DegenError for invalid codes
AnalysisResult analyze(const std::string& code);
AnalysisResult analyze(const DegenerateCodon& code);

// Deduplicated set of standard amino acids, kept sorted
class TargetSet {
public:
    TargetSet() = default;
    explicit TargetSet(const std::string& symbols);

    bool contains(char aa) const;
    bool empty() const { return symbols_.empty(); }
    size_t size() const { return symbols_.size(); }
    const std::string& str() const { return symbols_; }

    std::string::const_iterator begin() const { return symbols_.begin(); }
    std::string::const_iterator end() const { return symbols_.end(); }

private:
    std::string symbols_;
};

struct Evaluation {
    std::string code;
    int total_codons = 0;
    std::vector<std::pair<char, int>> amino_acid_counts;  // first-seen order
    std::string extra_amino_acids;    // present, not stop, not in target
    std::string missing_amino_acids;  // in target, absent from expansion
    int stop_count = 0;
    double stop_frequency = 0.0;      // percent

    bool covers_target() const { return missing_amino_acids.empty(); }
    size_t extra_count() const { return extra_amino_acids.size(); }
};

Evaluation evaluate(const DegenerateCodon& code, const TargetSet& target);

}  // namespace degen
