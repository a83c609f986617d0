#pragma once
// Position list input for the library command.
//
// One position per line, either "<name>\t<code>" or a bare "<code>"
// (bare codes are named "Position <n>"). Blank lines and lines starting
// with '#' are skipped. Files are read through zlib, so plain and gzip
// input both work; "-" reads stdin.

#include "degen/library.hpp"

#include <string>
#include <vector>

namespace degen {

// Parse one non-comment line; `ordinal` is the 1-based position number
Position parse_position_line(const std::string& line, uint32_t ordinal);

// Throws DegenError(INPUT_FORMAT) when the file cannot be opened or holds no positions
std::vector<Position> read_positions(const std::string& path);

}  // namespace degen
