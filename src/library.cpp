#include "degen/library.hpp"
#include "degen/codon_tables.hpp"
#include "degen/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace degen {

// Library size thresholds for screening advice
constexpr double SCREENABLE_SIZE = 1e6;
constexpr double SAMPLING_SIZE = 1e9;

void LibrarySize::multiply(uint64_t factor) {
    if (factor == 0) {
        throw std::invalid_argument("Library size factor must be at least 1");
    }
    log10_ += std::log10(static_cast<double>(factor));
    if (exact_) {
        if (value_ > EXACT_LIMIT / factor) {
            exact_ = false;
        } else {
            value_ *= factor;
            if (value_ > EXACT_LIMIT) exact_ = false;
        }
    }
}

double LibrarySize::approx() const {
    if (exact_) return static_cast<double>(value_);
    return std::pow(10.0, log10_);
}

std::string LibrarySize::format() const {
    if (exact_ && value_ < 1000) {
        return std::to_string(value_);
    }

    const double lg = exact_ ? std::log10(static_cast<double>(value_)) : log10_;
    int exponent = static_cast<int>(std::floor(lg));
    double mantissa = exact_ ? static_cast<double>(value_) / std::pow(10.0, exponent)
                             : std::pow(10.0, lg - exponent);
    mantissa = std::round(mantissa * 100.0) / 100.0;
    if (mantissa >= 10.0) {
        mantissa /= 10.0;
        ++exponent;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s%.2fe+%d", exact_ ? "" : "~", mantissa, exponent);
    return buf;
}

LibrarySize total_diversity(const std::vector<Position>& positions) {
    LibrarySize size;
    for (const auto& p : positions) {
        size.multiply(static_cast<uint64_t>(DegenerateCodon::parse(p.codon).expansion_size()));
    }
    return size;
}

LibrarySize total_diversity(const std::vector<AnalysisResult>& results) {
    LibrarySize size;
    for (const auto& r : results) {
        size.multiply(static_cast<uint64_t>(r.total_codons));
    }
    return size;
}

std::vector<PositionResult> positions_with_stop(const std::vector<PositionResult>& results) {
    std::vector<PositionResult> out;
    std::copy_if(results.begin(), results.end(), std::back_inserter(out),
                 [](const PositionResult& r) { return r.analysis.has_stop; });
    return out;
}

std::vector<std::string> recommendations(const LibrarySize& size,
                                         const std::vector<PositionResult>& results) {
    std::vector<std::string> out;
    const double n = size.approx();
    if (n < SCREENABLE_SIZE) {
        out.emplace_back("Library size is manageable for complete screening");
    } else if (n < SAMPLING_SIZE) {
        out.emplace_back("Library size requires sampling strategies");
    } else {
        out.emplace_back("Very large library - consider reducing diversity");
    }
    if (!positions_with_stop(results).empty()) {
        out.emplace_back("Some positions contain stop codons - consider using NNK/NNS instead of NNN");
    }
    return out;
}

std::vector<ExportRow> export_rows(const std::vector<PositionResult>& results) {
    std::vector<ExportRow> rows;
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        for (const auto& a : r.analysis.amino_acids) {
            const auto& info = amino_acid_info(a.aa);
            const auto category = category_of(a.aa);

            ExportRow row;
            row.position_index = i + 1;
            row.position_name = r.position.name;
            row.codon = r.analysis.code;
            row.aa = a.aa;
            row.aa_name = info.name;
            row.frequency = a.frequency;
            row.count = a.count;
            row.total_codons = r.analysis.total_codons;
            row.category = category ? property_to_string(*category) : "";
            row.charge = info.charge;
            row.polarity = info.polarity;
            row.size = info.size;
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

static std::string upper(const std::string& s) {
    std::string out = s;
    for (char& c : out) c = fast_upper(c);
    return out;
}

Library::Library() {
    for (uint32_t i = 1; i <= 3; ++i) {
        positions_.push_back({i, "Position " + std::to_string(i), "NNK"});
    }
}

Library::Library(std::vector<Position> positions) : positions_(std::move(positions)) {
    if (positions_.empty()) {
        throw DegenError(ErrorKind::INPUT_FORMAT, "A library needs at least one position");
    }
    for (auto& p : positions_) p.codon = upper(p.codon);
}

std::vector<Position>::iterator Library::find_locked(uint32_t id) {
    auto it = std::find_if(positions_.begin(), positions_.end(),
                           [id](const Position& p) { return p.id == id; });
    if (it == positions_.end()) {
        throw DegenError(ErrorKind::UNKNOWN_POSITION,
                         "No position with id " + std::to_string(id));
    }
    return it;
}

uint32_t Library::add_position(const std::string& name, const std::string& codon) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t next_id = 0;
    for (const auto& p : positions_) next_id = std::max(next_id, p.id);
    ++next_id;
    positions_.push_back({next_id, name, upper(codon)});
    return next_id;
}

void Library::remove_position(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (positions_.size() <= 1) {
        throw DegenError(ErrorKind::CANNOT_REMOVE_LAST_POSITION,
                         "Cannot remove the last position of a library");
    }
    positions_.erase(find_locked(id));
}

void Library::update_position(uint32_t id, PositionField field, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find_locked(id);
    if (field == PositionField::NAME) {
        it->name = value;
    } else {
        it->codon = upper(value);
    }
}

std::vector<PositionResult> Library::recalculate() {
    // Held for the whole pass so the committed results always match positions_
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PositionResult> fresh;
    fresh.reserve(positions_.size());
    for (const auto& p : positions_) {
        try {
            fresh.push_back({p, analyze(p.codon)});
        } catch (const DegenError& e) {
            throw DegenError(e.kind(), p.name + ": " + e.what(), e.symbol());
        }
    }

    std::vector<AnalysisResult> analyses;
    analyses.reserve(fresh.size());
    for (const auto& r : fresh) analyses.push_back(r.analysis);

    results_ = fresh;
    diversity_ = total_diversity(analyses);
    calculated_ = true;
    return fresh;
}

std::vector<Position> Library::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_;
}

std::vector<PositionResult> Library::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

LibrarySize Library::diversity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diversity_;
}

bool Library::calculated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calculated_;
}

size_t Library::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

}  // namespace degen
