#include "degen/synthesizer.hpp"
#include "degen/codon_tables.hpp"
#include "degen/combinations.hpp"
#include "degen/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace degen {

namespace {

void push_unique(std::vector<DegenerateCodon>& out, const DegenerateCodon& code) {
    if (std::find(out.begin(), out.end(), code) == out.end()) {
        out.push_back(code);
    }
}

// Smallest covering base sets drawn from `required`. A covering singleton is
// returned alone (first in A<C<G<T order); otherwise every covering subset of
// the smallest size that has one.
template <typename CoversFn>
std::vector<BaseSet> minimal_covers(BaseSet required, CoversFn&& covers) {
    const auto bases = members(required);
    for (Nucleotide nt : bases) {
        if (covers(base_bit(nt))) return {base_bit(nt)};
    }
    for (size_t k = 2; k <= bases.size(); ++k) {
        std::vector<BaseSet> found;
        for (const auto& subset : combinations(bases, k)) {
            const BaseSet set = to_base_set(subset);
            if (covers(set)) found.push_back(set);
        }
        if (!found.empty()) return found;
    }
    return {};
}

// Minimal position-3 covers for fixed position 1/2 sets, appended to `out`.
// A codon only counts at position 3 if positions 1 and 2 accept it.
void add_conditioned(std::vector<DegenerateCodon>& out, const TargetSet& target,
                     BaseSet first, BaseSet second) {
    auto conditioned = [&](BaseSet third) {
        for (char aa : target) {
            const auto& codons = codons_of(aa);
            const bool ok = std::any_of(codons.begin(), codons.end(), [&](const Codon& c) {
                return contains(first, c[0]) && contains(second, c[1]) && contains(third, c[2]);
            });
            if (!ok) return false;
        }
        return true;
    };
    for (BaseSet third : minimal_covers(required_bases(target, 2), conditioned)) {
        push_unique(out, DegenerateCodon::from_sets(first, second, third));
    }
}

std::vector<DegenerateCodon> design_minimal(const TargetSet& target) {
    std::array<std::vector<BaseSet>, 2> choices;
    for (size_t pos = 0; pos < 2; ++pos) {
        choices[pos] = minimal_covers(required_bases(target, pos),
                                      [&](BaseSet set) { return covers_position(target, pos, set); });
    }

    std::vector<DegenerateCodon> out;
    for (BaseSet first : choices[0]) {
        for (BaseSet second : choices[1]) {
            add_conditioned(out, target, first, second);
        }
    }

    // Independent position 1/2 covers can pair bases from different codons
    // (Ser: A from AGY, C from TCN). The full unions always admit every
    // target codon, so position 3 is then coverable.
    if (out.empty()) {
        add_conditioned(out, target, required_bases(target, 0), required_bases(target, 1));
    }
    return out;
}

std::vector<DegenerateCodon> design_all(const TargetSet& target) {
    const BaseSet r1 = required_bases(target, 0);
    const BaseSet r2 = required_bases(target, 1);
    const BaseSet r3 = required_bases(target, 2);

    std::vector<DegenerateCodon> out;
    for (Nucleotide b1 : members(r1)) {
        for (Nucleotide b2 : members(r2)) {
            for (Nucleotide b3 : members(r3)) {
                push_unique(out, DegenerateCodon::from_sets(base_bit(b1), base_bit(b2), base_bit(b3)));
            }
        }
    }
    push_unique(out, DegenerateCodon::from_sets(r1, r2, r3));
    return out;
}

// Subsets of size 1..min(3, |required|), by size then lexicographic
std::vector<BaseSet> bounded_subsets(BaseSet required) {
    const auto bases = members(required);
    const size_t max_k = std::min(BALANCED_MAX_SUBSET, bases.size());
    std::vector<BaseSet> out;
    for (size_t k = 1; k <= max_k; ++k) {
        for (const auto& subset : combinations(bases, k)) {
            out.push_back(to_base_set(subset));
        }
    }
    return out;
}

std::vector<CoverCandidate> rank_balanced(const TargetSet& target) {
    const TargetSet widened = expand_by_category(target);
    const auto p1 = bounded_subsets(required_bases(widened, 0));
    const auto p2 = bounded_subsets(required_bases(widened, 1));
    const auto p3 = bounded_subsets(required_bases(widened, 2));

    std::vector<CoverCandidate> all;
    all.reserve(p1.size() * p2.size() * p3.size());
    for (BaseSet s1 : p1) {
        for (BaseSet s2 : p2) {
            for (BaseSet s3 : p3) {
                auto code = DegenerateCodon::from_sets(s1, s2, s3);
                auto eval = evaluate(code, target);
                all.push_back({std::move(code), std::move(eval)});
            }
        }
    }

    // Keep the codes missing the fewest original target amino acids (none,
    // whenever some candidate covers the whole target)
    size_t fewest_missing = target.size();
    for (const auto& c : all) {
        fewest_missing = std::min(fewest_missing, c.evaluation.missing_amino_acids.size());
    }
    std::vector<CoverCandidate> ranked;
    for (auto& c : all) {
        if (c.evaluation.missing_amino_acids.size() == fewest_missing) ranked.push_back(std::move(c));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const CoverCandidate& a, const CoverCandidate& b) {
                         if (a.evaluation.stop_frequency != b.evaluation.stop_frequency) {
                             return a.evaluation.stop_frequency < b.evaluation.stop_frequency;
                         }
                         return a.evaluation.extra_count() < b.evaluation.extra_count();
                     });
    if (ranked.size() > BALANCED_TOP_N) ranked.resize(BALANCED_TOP_N);
    return ranked;
}

}  // namespace

Strategy parse_strategy(const std::string& name) {
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "minimal") return Strategy::MINIMAL;
    if (lower == "all") return Strategy::ALL;
    if (lower == "balanced") return Strategy::BALANCED;
    throw DegenError(ErrorKind::UNKNOWN_STRATEGY,
                     "Unknown strategy '" + name + "' (expected minimal, all or balanced)");
}

const char* strategy_to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::MINIMAL: return "minimal";
        case Strategy::ALL: return "all";
        default: return "balanced";
    }
}

TargetSet parse_target(const std::string& amino_acids) {
    TargetSet target(amino_acids);
    if (target.empty()) {
        throw DegenError(ErrorKind::EMPTY_TARGET,
                         "No valid amino acids in '" + amino_acids + "'");
    }
    return target;
}

BaseSet required_bases(const TargetSet& target, size_t pos) {
    BaseSet set = 0;
    for (char aa : target) {
        for (const Codon& c : codons_of(aa)) {
            set |= base_bit(c[pos]);
        }
    }
    return set;
}

bool covers_position(const TargetSet& target, size_t pos, BaseSet bases) {
    for (char aa : target) {
        const auto& codons = codons_of(aa);
        const bool ok = std::any_of(codons.begin(), codons.end(),
                                    [&](const Codon& c) { return contains(bases, c[pos]); });
        if (!ok) return false;
    }
    return true;
}

TargetSet expand_by_category(const TargetSet& target) {
    std::string widened = target.str();
    for (const char* p = STANDARD_AMINO_ACIDS; *p; ++p) {
        const auto category = category_of(*p);
        for (char aa : target) {
            if (category && category == category_of(aa)) {
                widened += *p;
                break;
            }
        }
    }
    return TargetSet(widened);
}

std::vector<DegenerateCodon> design_codons(const TargetSet& target, Strategy strategy) {
    if (target.empty()) {
        throw DegenError(ErrorKind::EMPTY_TARGET, "Target amino acid set is empty");
    }
    switch (strategy) {
        case Strategy::MINIMAL:
            return design_minimal(target);
        case Strategy::ALL:
            return design_all(target);
        default: {
            std::vector<DegenerateCodon> out;
            for (const auto& c : rank_balanced(target)) out.push_back(c.code);
            return out;
        }
    }
}

GeneratorResult synthesize(const std::string& amino_acids, Strategy strategy) {
    GeneratorResult result;
    result.target = parse_target(amino_acids);
    result.strategy = strategy;

    if (strategy == Strategy::BALANCED) {
        result.candidates = rank_balanced(result.target);
        return result;
    }
    for (const auto& code : design_codons(result.target, strategy)) {
        result.candidates.push_back({code, evaluate(code, result.target)});
    }
    return result;
}

}  // namespace degen
