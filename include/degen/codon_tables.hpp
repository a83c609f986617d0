#pragma once

#include "degen/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace degen {

/**
 * Fixed alphabet tables: IUPAC ambiguity codes, the standard genetic code,
 * its inverse, and amino acid categories. All tables are built once on
 * first use and never modified.
 */

// Fast uppercase
inline char fast_upper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 32) : c;
}

// True for the 15 IUPAC nucleotide letters (case-insensitive)
bool is_iupac_code(char code);

// IUPAC code -> base set. Throws DegenError(INVALID_CODE) for anything else.
BaseSet bases_of(char code);

// Base set -> its single IUPAC letter. Throws std::logic_error on the empty set.
char canonical_code(BaseSet bases);

// Standard genetic code, total over the 64 codons
char translate(const Codon& codon);

// All codons translating to `aa`, ascending ACGT order. Empty for unknown symbols.
const std::vector<Codon>& codons_of(char aa);

// Category of a standard amino acid; nullopt for stop or unknown symbols
std::optional<AminoAcidProperty> category_of(char aa);

// Descriptive labels shown next to each amino acid
struct AminoAcidInfo {
    char symbol;
    const char* name;
    const char* charge;
    const char* polarity;
    const char* size;
};

// Info for one of the 21 translation symbols; unknown symbols get "Unknown"
const AminoAcidInfo& amino_acid_info(char aa);

struct IupacEntry {
    char code;
    BaseSet bases;
    const char* mnemonic;
};

// The 15 IUPAC codes in reference order (exact bases first)
const std::vector<IupacEntry>& iupac_table();

}  // namespace degen
