#pragma once

#include "degen/types.hpp"

#include <string>
#include <vector>

namespace degen {

// Ordered Cartesian product of the three positions' base sets, last position
// fastest. Throws DegenError (INVALID_CODON_LENGTH / INVALID_CODE).
std::vector<Codon> expand(const std::string& code);
std::vector<Codon> expand(const DegenerateCodon& code);

}  // namespace degen
