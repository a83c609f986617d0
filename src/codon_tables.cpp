/**
 * Alphabet tables for degenerate codon analysis
 *
 * Translation table encoding: T=0, C=1, A=2, G=3
 * Index = base1*16 + base2*4 + base3
 */

#include "degen/codon_tables.hpp"
#include "degen/errors.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace degen {

// Convert nucleotide to translation table index: T=0, C=1, A=2, G=3
static inline int nt_to_tcag(Nucleotide nt) {
    switch (nt) {
        case Nucleotide::T: return 0;
        case Nucleotide::C: return 1;
        case Nucleotide::A: return 2;
        default: return 3;
    }
}

static inline int codon_to_tcag_idx(const Codon& c) {
    return nt_to_tcag(c[0]) * 16 + nt_to_tcag(c[1]) * 4 + nt_to_tcag(c[2]);
}

// Codon to amino acid translation table (TCAG order)
static const std::array<char, 64> CODON_TO_AA = []() {
    std::array<char, 64> arr{};

    // TTx: Phe, Phe, Leu, Leu
    arr[0] = 'F'; arr[1] = 'F'; arr[2] = 'L'; arr[3] = 'L';
    // TCx: Ser
    arr[4] = 'S'; arr[5] = 'S'; arr[6] = 'S'; arr[7] = 'S';
    // TAx: Tyr, Tyr, Stop, Stop
    arr[8] = 'Y'; arr[9] = 'Y'; arr[10] = '*'; arr[11] = '*';
    // TGx: Cys, Cys, Stop, Trp
    arr[12] = 'C'; arr[13] = 'C'; arr[14] = '*'; arr[15] = 'W';

    // CTx: Leu
    arr[16] = 'L'; arr[17] = 'L'; arr[18] = 'L'; arr[19] = 'L';
    // CCx: Pro
    arr[20] = 'P'; arr[21] = 'P'; arr[22] = 'P'; arr[23] = 'P';
    // CAx: His, His, Gln, Gln
    arr[24] = 'H'; arr[25] = 'H'; arr[26] = 'Q'; arr[27] = 'Q';
    // CGx: Arg
    arr[28] = 'R'; arr[29] = 'R'; arr[30] = 'R'; arr[31] = 'R';

    // ATx: Ile, Ile, Ile, Met
    arr[32] = 'I'; arr[33] = 'I'; arr[34] = 'I'; arr[35] = 'M';
    // ACx: Thr
    arr[36] = 'T'; arr[37] = 'T'; arr[38] = 'T'; arr[39] = 'T';
    // AAx: Asn, Asn, Lys, Lys
    arr[40] = 'N'; arr[41] = 'N'; arr[42] = 'K'; arr[43] = 'K';
    // AGx: Ser, Ser, Arg, Arg
    arr[44] = 'S'; arr[45] = 'S'; arr[46] = 'R'; arr[47] = 'R';

    // GTx: Val
    arr[48] = 'V'; arr[49] = 'V'; arr[50] = 'V'; arr[51] = 'V';
    // GCx: Ala
    arr[52] = 'A'; arr[53] = 'A'; arr[54] = 'A'; arr[55] = 'A';
    // GAx: Asp, Asp, Glu, Glu
    arr[56] = 'D'; arr[57] = 'D'; arr[58] = 'E'; arr[59] = 'E';
    // GGx: Gly
    arr[60] = 'G'; arr[61] = 'G'; arr[62] = 'G'; arr[63] = 'G';

    return arr;
}();

static constexpr BaseSet BA = base_bit(Nucleotide::A);
static constexpr BaseSet BC = base_bit(Nucleotide::C);
static constexpr BaseSet BG = base_bit(Nucleotide::G);
static constexpr BaseSet BT = base_bit(Nucleotide::T);

static const std::vector<IupacEntry> IUPAC_TABLE = {
    {'A', BA, "Adenine"},
    {'C', BC, "Cytosine"},
    {'G', BG, "Guanine"},
    {'T', BT, "Thymine"},
    {'R', BA | BG, "puRine"},
    {'Y', BC | BT, "pYrimidine"},
    {'W', BA | BT, "Weak"},
    {'S', BC | BG, "Strong"},
    {'M', BA | BC, "aMino"},
    {'K', BG | BT, "Keto"},
    {'H', BA | BC | BT, "not G"},
    {'B', BC | BG | BT, "not A"},
    {'V', BA | BC | BG, "not T"},
    {'D', BA | BG | BT, "not C"},
    {'N', BA | BC | BG | BT, "aNy"},
};

// Letter -> base set (0 = not an IUPAC letter), indexed by char - 'A'
static const std::array<BaseSet, 26> LETTER_TO_SET = []() {
    std::array<BaseSet, 26> arr{};
    for (const auto& e : IUPAC_TABLE) {
        arr[e.code - 'A'] = e.bases;
    }
    return arr;
}();

// Base set -> letter; every non-empty mask has exactly one code
static const std::array<char, 16> SET_TO_LETTER = []() {
    std::array<char, 16> arr{};
    for (const auto& e : IUPAC_TABLE) {
        arr[e.bases] = e.code;
    }
    return arr;
}();

// Inverse of the genetic code, indexed by char - '*'
static const std::array<std::vector<Codon>, 'Z' - '*' + 1> AA_TO_CODONS = []() {
    std::array<std::vector<Codon>, 'Z' - '*' + 1> arr{};
    for (int idx = 0; idx < 64; ++idx) {
        Codon c = Codon::from_index(idx);
        arr[CODON_TO_AA[codon_to_tcag_idx(c)] - '*'].push_back(c);
    }
    return arr;
}();

static const std::array<AminoAcidInfo, 21> AA_INFO = {{
    {'A', "Alanine", "neutral", "nonpolar", "small"},
    {'R', "Arginine", "positive", "polar", "large"},
    {'N', "Asparagine", "neutral", "polar", "small"},
    {'D', "Aspartic acid", "negative", "polar", "small"},
    {'C', "Cysteine", "neutral", "slightly_polar", "small"},
    {'Q', "Glutamine", "neutral", "polar", "medium"},
    {'E', "Glutamic acid", "negative", "polar", "medium"},
    {'G', "Glycine", "neutral", "nonpolar", "tiny"},
    {'H', "Histidine", "slightly_positive", "polar", "medium"},
    {'I', "Isoleucine", "neutral", "nonpolar", "medium"},
    {'L', "Leucine", "neutral", "nonpolar", "medium"},
    {'K', "Lysine", "positive", "polar", "large"},
    {'M', "Methionine", "neutral", "nonpolar", "medium"},
    {'F', "Phenylalanine", "neutral", "nonpolar", "large"},
    {'P', "Proline", "neutral", "nonpolar", "medium"},
    {'S', "Serine", "neutral", "polar", "small"},
    {'T', "Threonine", "neutral", "polar", "small"},
    {'W', "Tryptophan", "neutral", "nonpolar", "large"},
    {'Y', "Tyrosine", "neutral", "slightly_polar", "large"},
    {'V', "Valine", "neutral", "nonpolar", "medium"},
    {'*', "STOP", "none", "none", "none"},
}};

static const AminoAcidInfo UNKNOWN_INFO = {'?', "Unknown", "unknown", "unknown", "unknown"};

bool is_iupac_code(char code) {
    char c = fast_upper(code);
    return c >= 'A' && c <= 'Z' && LETTER_TO_SET[c - 'A'] != 0;
}

BaseSet bases_of(char code) {
    if (!is_iupac_code(code)) {
        throw DegenError(ErrorKind::INVALID_CODE,
                         std::string("Invalid IUPAC code: ") + code, code);
    }
    return LETTER_TO_SET[fast_upper(code) - 'A'];
}

char canonical_code(BaseSet bases) {
    bases &= 0x0F;
    if (bases == 0) {
        throw std::logic_error("No canonical IUPAC code for an empty base set");
    }
    return SET_TO_LETTER[bases];
}

char translate(const Codon& codon) {
    return CODON_TO_AA[codon_to_tcag_idx(codon)];
}

const std::vector<Codon>& codons_of(char aa) {
    static const std::vector<Codon> none;
    char c = fast_upper(aa);
    if (c < '*' || c > 'Z') return none;
    return AA_TO_CODONS[c - '*'];
}

std::optional<AminoAcidProperty> category_of(char aa) {
    switch (fast_upper(aa)) {
        case 'K': case 'R': case 'H':
            return AminoAcidProperty::POSITIVE;
        case 'D': case 'E':
            return AminoAcidProperty::NEGATIVE;
        case 'S': case 'T': case 'N': case 'Q': case 'C': case 'Y':
            return AminoAcidProperty::POLAR;
        case 'A': case 'V': case 'L': case 'I': case 'M':
        case 'F': case 'W': case 'P': case 'G':
            return AminoAcidProperty::NONPOLAR;
        default:
            return std::nullopt;
    }
}

const AminoAcidInfo& amino_acid_info(char aa) {
    char c = fast_upper(aa);
    for (const auto& info : AA_INFO) {
        if (info.symbol == c) return info;
    }
    return UNKNOWN_INFO;
}

const std::vector<IupacEntry>& iupac_table() {
    return IUPAC_TABLE;
}

}  // namespace degen
