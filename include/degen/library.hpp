#pragma once
// Combinatorial library of degenerate codon positions.
//
// The position list is never empty. recalculate() analyses every position
// into a local result set and commits it only when all positions are valid;
// on failure the previously committed results stay as they were. A mutex
// guards the position list and the committed state and is held through a
// whole recalculation, so edits wait for it to finish. Readers always get
// copies.

#include "degen/analyzer.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace degen {

struct Position {
    uint32_t id = 0;
    std::string name;
    std::string codon;
};

// Product of expansion sizes. Exact while it fits in 53 bits, otherwise
// carried as a base-10 logarithm.
class LibrarySize {
public:
    static constexpr uint64_t EXACT_LIMIT = uint64_t{1} << 53;

    LibrarySize() = default;

    // Throws std::invalid_argument for a zero factor
    void multiply(uint64_t factor);

    bool is_exact() const { return exact_; }
    uint64_t exact_value() const { return value_; }  // meaningful when is_exact()
    double log10() const { return log10_; }
    double approx() const;

    // "<n>" below 1000, "m.mme+X" from 1000 on; approximate values get a "~"
    std::string format() const;

private:
    uint64_t value_ = 1;
    double log10_ = 0.0;
    bool exact_ = true;
};

LibrarySize total_diversity(const std::vector<Position>& positions);
LibrarySize total_diversity(const std::vector<AnalysisResult>& results);

struct PositionResult {
    Position position;
    AnalysisResult analysis;
};

std::vector<PositionResult> positions_with_stop(const std::vector<PositionResult>& results);

// Size and stop-codon advice for a computed library
std::vector<std::string> recommendations(const LibrarySize& size,
                                         const std::vector<PositionResult>& results);

// One row per (position, amino acid) of the computed results
struct ExportRow {
    size_t position_index = 0;  // 1-based
    std::string position_name;
    std::string codon;
    char aa = '?';
    std::string aa_name;
    double frequency = 0.0;
    int count = 0;
    int total_codons = 0;
    std::string category;  // empty for stop
    std::string charge;
    std::string polarity;
    std::string size;
};

std::vector<ExportRow> export_rows(const std::vector<PositionResult>& results);

enum class PositionField {
    NAME,
    CODON
};

class Library {
public:
    // Three NNK positions
    Library();

    // Throws DegenError(INPUT_FORMAT) when `positions` is empty
    explicit Library(std::vector<Position> positions);

    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;

    // Returns the new position id (largest id + 1). Codon is upper-cased.
    uint32_t add_position(const std::string& name, const std::string& codon);

    // Throws CANNOT_REMOVE_LAST_POSITION / UNKNOWN_POSITION, leaving the library unchanged
    void remove_position(uint32_t id);

    // Throws UNKNOWN_POSITION
    void update_position(uint32_t id, PositionField field, const std::string& value);

    // All-or-nothing. Throws the first DegenError; committed results unchanged.
    std::vector<PositionResult> recalculate();

    std::vector<Position> positions() const;
    std::vector<PositionResult> results() const;
    LibrarySize diversity() const;
    bool calculated() const;
    size_t size() const;

private:
    std::vector<Position>::iterator find_locked(uint32_t id);

    mutable std::mutex mutex_;
    std::vector<Position> positions_;
    std::vector<PositionResult> results_;
    LibrarySize diversity_;
    bool calculated_ = false;
};

}  // namespace degen
