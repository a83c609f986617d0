#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace degen {

// Nucleotide encoding (lexical order, used for every tie-break)
enum class Nucleotide : uint8_t {
    A = 0,
    C = 1,
    G = 2,
    T = 3
};

constexpr std::array<Nucleotide, 4> ALL_NUCLEOTIDES = {
    Nucleotide::A, Nucleotide::C, Nucleotide::G, Nucleotide::T
};

inline char nt_to_char(Nucleotide nt) {
    switch (nt) {
        case Nucleotide::A: return 'A';
        case Nucleotide::C: return 'C';
        case Nucleotide::G: return 'G';
        default: return 'T';
    }
}

// Subset of {A,C,G,T} as a 4-bit mask: A=1, C=2, G=4, T=8
using BaseSet = uint8_t;

constexpr BaseSet base_bit(Nucleotide nt) {
    return static_cast<BaseSet>(1u << static_cast<uint8_t>(nt));
}

constexpr bool contains(BaseSet set, Nucleotide nt) {
    return (set & base_bit(nt)) != 0;
}

inline int base_count(BaseSet set) {
    int n = 0;
    for (Nucleotide nt : ALL_NUCLEOTIDES) {
        if (contains(set, nt)) ++n;
    }
    return n;
}

// Members of a set in ascending lexical order
inline std::vector<Nucleotide> members(BaseSet set) {
    std::vector<Nucleotide> out;
    for (Nucleotide nt : ALL_NUCLEOTIDES) {
        if (contains(set, nt)) out.push_back(nt);
    }
    return out;
}

inline BaseSet to_base_set(const std::vector<Nucleotide>& bases) {
    BaseSet set = 0;
    for (Nucleotide nt : bases) set |= base_bit(nt);
    return set;
}

// Concrete codon: ordered triple of nucleotides (64 values)
struct Codon {
    std::array<Nucleotide, 3> bases{};

    Nucleotide operator[](size_t i) const { return bases[i]; }

    // 0..63, first base most significant, ACGT order
    int index() const {
        return static_cast<int>(bases[0]) * 16 +
               static_cast<int>(bases[1]) * 4 +
               static_cast<int>(bases[2]);
    }

    std::string str() const {
        return {nt_to_char(bases[0]), nt_to_char(bases[1]), nt_to_char(bases[2])};
    }

    static Codon from_index(int idx) {
        Codon c;
        c.bases[0] = static_cast<Nucleotide>((idx >> 4) & 3);
        c.bases[1] = static_cast<Nucleotide>((idx >> 2) & 3);
        c.bases[2] = static_cast<Nucleotide>(idx & 3);
        return c;
    }

    bool operator==(const Codon& other) const { return bases == other.bases; }
    bool operator!=(const Codon& other) const { return !(*this == other); }
};

// Physicochemical category of a standard amino acid
enum class AminoAcidProperty : uint8_t {
    POSITIVE,
    NEGATIVE,
    POLAR,
    NONPOLAR
};

inline const char* property_to_string(AminoAcidProperty p) {
    switch (p) {
        case AminoAcidProperty::POSITIVE: return "positive";
        case AminoAcidProperty::NEGATIVE: return "negative";
        case AminoAcidProperty::POLAR: return "polar";
        default: return "nonpolar";
    }
}

constexpr char STOP_SYMBOL = '*';

// The 20 standard one-letter amino acid codes
constexpr const char* STANDARD_AMINO_ACIDS = "ACDEFGHIKLMNPQRSTVWY";

inline bool is_standard_amino_acid(char aa) {
    for (const char* p = STANDARD_AMINO_ACIDS; *p; ++p) {
        if (*p == aa) return true;
    }
    return false;
}

// Three-letter IUPAC code, stored upper-case and validated on construction.
class DegenerateCodon {
public:
    DegenerateCodon() = default;

    // Throws DegenError (InvalidCodonLength / InvalidCode)
    static DegenerateCodon parse(const std::string& code);

    // Built from per-position base sets; every set must be non-empty
    static DegenerateCodon from_sets(BaseSet p1, BaseSet p2, BaseSet p3);

    const std::string& str() const { return code_; }
    char at(size_t i) const { return code_[i]; }
    BaseSet set_at(size_t i) const { return sets_[i]; }

    // Number of concrete codons in the expansion (1..64)
    int expansion_size() const {
        return base_count(sets_[0]) * base_count(sets_[1]) * base_count(sets_[2]);
    }

    bool operator==(const DegenerateCodon& other) const { return code_ == other.code_; }
    bool operator!=(const DegenerateCodon& other) const { return code_ != other.code_; }

private:
    std::string code_;
    std::array<BaseSet, 3> sets_{};
};

}  // namespace degen
