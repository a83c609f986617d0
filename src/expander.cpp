#include "degen/expander.hpp"
#include "degen/codon_tables.hpp"
#include "degen/errors.hpp"

namespace degen {

DegenerateCodon DegenerateCodon::parse(const std::string& code) {
    if (code.size() != 3) {
        throw DegenError(ErrorKind::INVALID_CODON_LENGTH,
                         "Codon must be exactly 3 bases long, got '" + code + "'");
    }
    DegenerateCodon dc;
    dc.code_.reserve(3);
    for (size_t i = 0; i < 3; ++i) {
        dc.sets_[i] = bases_of(code[i]);
        dc.code_ += fast_upper(code[i]);
    }
    return dc;
}

DegenerateCodon DegenerateCodon::from_sets(BaseSet p1, BaseSet p2, BaseSet p3) {
    DegenerateCodon dc;
    dc.sets_ = {p1, p2, p3};
    dc.code_ = {canonical_code(p1), canonical_code(p2), canonical_code(p3)};
    return dc;
}

std::vector<Codon> expand(const DegenerateCodon& code) {
    std::vector<Codon> out;
    out.reserve(static_cast<size_t>(code.expansion_size()));

    const auto first = members(code.set_at(0));
    const auto second = members(code.set_at(1));
    const auto third = members(code.set_at(2));

    for (Nucleotide b1 : first) {
        for (Nucleotide b2 : second) {
            for (Nucleotide b3 : third) {
                out.push_back(Codon{{b1, b2, b3}});
            }
        }
    }
    return out;
}

std::vector<Codon> expand(const std::string& code) {
    return expand(DegenerateCodon::parse(code));
}

}  // namespace degen
