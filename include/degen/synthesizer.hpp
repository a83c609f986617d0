#pragma once
// Reverse synthesis: from a target amino acid set to covering degenerate
// codons.
//
// Strategies:
//   minimal  - per-position minimal base covers; position 3 conditioned on
//              the chosen position 1/2 sets. First covering singleton wins.
//   all      - every exact codon over the required-base unions, plus the
//              fully ambiguous union code.
//   balanced - target widened to whole physicochemical categories, subsets
//              of size 1..3 per position, ranked by stop frequency then by
//              off-target amino acid count; top 5.

#include "degen/analyzer.hpp"
#include "degen/types.hpp"

#include <string>
#include <vector>

namespace degen {

enum class Strategy {
    MINIMAL,
    ALL,
    BALANCED
};

// Throws DegenError(UNKNOWN_STRATEGY)
Strategy parse_strategy(const std::string& name);
const char* strategy_to_string(Strategy strategy);

constexpr size_t BALANCED_TOP_N = 5;
constexpr size_t BALANCED_MAX_SUBSET = 3;

// Upper-cases, keeps the 20 standard letters, de-duplicates.
// Throws DegenError(EMPTY_TARGET) when nothing is left.
TargetSet parse_target(const std::string& amino_acids);

// Union over the target of the bases found at `pos` (0..2) in its codons
BaseSet required_bases(const TargetSet& target, size_t pos);

// Every member of `target` can use some base of `bases` at `pos`
bool covers_position(const TargetSet& target, size_t pos, BaseSet bases);

// Target widened by every amino acid sharing a category with a member
TargetSet expand_by_category(const TargetSet& target);

std::vector<DegenerateCodon> design_codons(const TargetSet& target, Strategy strategy);

struct CoverCandidate {
    DegenerateCodon code;
    Evaluation evaluation;
};

struct GeneratorResult {
    TargetSet target;
    Strategy strategy = Strategy::MINIMAL;
    std::vector<CoverCandidate> candidates;
};

// Boundary call: parse, design and evaluate
GeneratorResult synthesize(const std::string& amino_acids, Strategy strategy);

}  // namespace degen
