// Library manager tests: diversity, position edits, all-or-nothing recalculation

#include "degen/errors.hpp"
#include "degen/library.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

template <typename Fn>
bool throws_kind(Fn&& fn, degen::ErrorKind kind) {
    try {
        fn();
    } catch (const degen::DegenError& e) {
        return e.kind() == kind;
    }
    return false;
}

std::vector<degen::Position> make_positions(const std::vector<std::string>& codes) {
    std::vector<degen::Position> out;
    for (size_t i = 0; i < codes.size(); ++i) {
        out.push_back({static_cast<uint32_t>(i + 1), "P" + std::to_string(i + 1), codes[i]});
    }
    return out;
}

int test_library_size() {
    std::cout << "[diversity] exact and approximate sizes\n";
    int failed = 0;

    degen::LibrarySize small;
    small.multiply(32);
    expect(small.is_exact() && small.exact_value() == 32, "32 exact", failed);
    expect(small.format() == "32", "plain integer below 1000", failed);

    const auto nnk3 = degen::total_diversity(make_positions({"NNK", "NNK", "NNK"}));
    expect(nnk3.is_exact() && nnk3.exact_value() == 32768, "NNK x3 = 32768", failed);
    expect(nnk3.format() == "3.28e+4", "NNK x3 formatted: " + nnk3.format(), failed);

    // 64^8 = 2^48 still exact, 64^9 = 2^54 is not
    const auto nnn8 = degen::total_diversity(make_positions(std::vector<std::string>(8, "NNN")));
    expect(nnn8.is_exact() && nnn8.exact_value() == (uint64_t{1} << 48), "2^48 exact", failed);
    const auto nnn9 = degen::total_diversity(make_positions(std::vector<std::string>(9, "NNN")));
    expect(!nnn9.is_exact(), "2^54 approximate", failed);

    const auto nnn12 = degen::total_diversity(make_positions(std::vector<std::string>(12, "NNN")));
    expect(!nnn12.is_exact(), "64^12 approximate", failed);
    expect(std::fabs(nnn12.log10() - 72.0 * std::log10(2.0)) < 1e-9, "log10 of 2^72", failed);
    expect(nnn12.format() == "~4.72e+21", "approximate format: " + nnn12.format(), failed);

    bool threw = false;
    try {
        degen::LibrarySize zero;
        zero.multiply(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "zero factor rejected", failed);

    const auto one = degen::total_diversity(make_positions({"TGG"}));
    expect(one.format() == "1", "single exact codon", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_position_edits() {
    std::cout << "[library] add / remove / update\n";
    int failed = 0;

    degen::Library lib;
    expect(lib.size() == 3, "default has three positions", failed);
    for (const auto& p : lib.positions()) {
        expect(p.codon == "NNK", "default codon NNK", failed);
    }
    expect(!lib.calculated(), "not calculated before recalculate", failed);

    const uint32_t id = lib.add_position("Loop", "nns");
    expect(id == 4, "new id is max + 1", failed);
    expect(lib.positions().back().codon == "NNS", "codon upper-cased", failed);

    lib.remove_position(2);
    expect(lib.size() == 3, "position removed", failed);
    expect(lib.add_position("Tail", "TGG") == 5, "ids are not reused", failed);

    lib.update_position(1, degen::PositionField::CODON, "gsa");
    lib.update_position(1, degen::PositionField::NAME, "Site A");
    expect(lib.positions().front().codon == "GSA" && lib.positions().front().name == "Site A",
           "update name and codon", failed);

    expect(throws_kind([&] { lib.remove_position(99); }, degen::ErrorKind::UNKNOWN_POSITION),
           "remove unknown id", failed);
    expect(throws_kind([&] { lib.update_position(99, degen::PositionField::NAME, "x"); },
                       degen::ErrorKind::UNKNOWN_POSITION),
           "update unknown id", failed);

    degen::Library single(make_positions({"NNK"}));
    expect(throws_kind([&] { single.remove_position(1); },
                       degen::ErrorKind::CANNOT_REMOVE_LAST_POSITION),
           "last position kept", failed);
    expect(single.size() == 1 && single.positions()[0].codon == "NNK", "library unchanged", failed);

    expect(throws_kind([] { degen::Library empty(std::vector<degen::Position>{}); },
                       degen::ErrorKind::INPUT_FORMAT),
           "empty position list rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_recalculate() {
    std::cout << "[library] all-or-nothing recalculation\n";
    int failed = 0;

    degen::Library lib;
    const auto results = lib.recalculate();
    expect(results.size() == 3 && lib.calculated(), "three results committed", failed);
    expect(lib.diversity().exact_value() == 32768, "diversity committed", failed);
    expect(degen::positions_with_stop(results).size() == 3, "NNK positions have stops", failed);

    // A bad codon fails the whole pass and keeps the previous results
    lib.update_position(2, degen::PositionField::CODON, "NXK");
    bool threw = false;
    try {
        lib.recalculate();
    } catch (const degen::DegenError& e) {
        threw = e.kind() == degen::ErrorKind::INVALID_CODE &&
                std::string(e.what()).find("Position 2") != std::string::npos;
    }
    expect(threw, "invalid code reported with position name", failed);
    const auto kept = lib.results();
    expect(kept.size() == 3 && kept[1].analysis.code == "NNK", "previous results kept", failed);
    expect(lib.diversity().exact_value() == 32768, "previous diversity kept", failed);

    lib.update_position(2, degen::PositionField::CODON, "NN");
    expect(throws_kind([&] { lib.recalculate(); }, degen::ErrorKind::INVALID_CODON_LENGTH),
           "short code fails recalculation", failed);

    lib.update_position(2, degen::PositionField::CODON, "TGG");
    lib.recalculate();
    expect(lib.diversity().exact_value() == 1024, "32 * 1 * 32", failed);
    expect(degen::positions_with_stop(lib.results()).size() == 2, "TGG has no stop", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_recommendations_and_export() {
    std::cout << "[library] recommendations and export rows\n";
    int failed = 0;

    degen::Library lib;
    const auto results = lib.recalculate();
    const auto advice = degen::recommendations(lib.diversity(), results);
    expect(advice.size() == 2, "size advice plus stop warning", failed);
    if (advice.size() == 2) {
        expect(advice[0].find("manageable") != std::string::npos, "32768 is manageable", failed);
        expect(advice[1].find("stop") != std::string::npos, "stop warning", failed);
    }

    degen::Library big(make_positions(std::vector<std::string>(5, "NNS")));
    const auto big_results = big.recalculate();
    const auto big_advice = degen::recommendations(big.diversity(), big_results);
    expect(!big_advice.empty() && big_advice[0].find("sampling") != std::string::npos,
           "32^5 needs sampling", failed);

    degen::Library clean(make_positions({"GSA", "TGG"}));
    const auto clean_results = clean.recalculate();
    const auto clean_advice = degen::recommendations(clean.diversity(), clean_results);
    expect(clean_advice.size() == 1, "no stop warning without stops", failed);

    const auto huge = degen::total_diversity(make_positions(std::vector<std::string>(6, "NNN")));
    const auto huge_advice = degen::recommendations(huge, clean_results);
    expect(huge_advice[0].find("Very large") != std::string::npos, "64^6 very large", failed);

    const auto rows = degen::export_rows(clean_results);
    expect(rows.size() == 3, "GSA gives A and G, TGG gives W", failed);
    if (rows.size() == 3) {
        expect(rows[0].position_index == 1 && rows[2].position_index == 2, "1-based index", failed);
        expect(rows[2].aa == 'W' && rows[2].aa_name == "Tryptophan", "W row", failed);
        expect(rows[2].category == "nonpolar" && rows[2].total_codons == 1, "W category", failed);
        expect(rows[0].count == 1 && rows[0].total_codons == 2, "GSA counts", failed);
    }

    const auto stop_rows = degen::export_rows(results);
    bool stop_blank = false;
    for (const auto& r : stop_rows) {
        if (r.aa == '*') stop_blank = r.category.empty();
    }
    expect(stop_blank, "stop row has no category", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_concurrent_edits() {
    std::cout << "[library] concurrent add and recalculate\n";
    int failed = 0;

    degen::Library lib;
    std::thread writer([&] {
        for (int i = 0; i < 50; ++i) lib.add_position("Extra", "NNK");
    });
    std::thread reader([&] {
        for (int i = 0; i < 20; ++i) lib.recalculate();
    });
    writer.join();
    reader.join();

    expect(lib.size() == 53, "all additions applied", failed);
    const auto results = lib.recalculate();
    expect(results.size() == 53, "final recalculation sees every position", failed);
    expect(!lib.diversity().is_exact(), "32^53 is approximate", failed);

    // A slower pass must never commit over a newer edit's results
    int stale = 0;
    for (int round = 0; round < 500; ++round) {
        degen::Library raced;
        std::thread first([&] { raced.recalculate(); });
        std::thread second([&] {
            raced.update_position(1, degen::PositionField::CODON, "TGG");
            raced.recalculate();
        });
        first.join();
        second.join();

        const auto committed = raced.results();
        const auto held = raced.positions();
        bool consistent = committed.size() == held.size();
        for (size_t i = 0; consistent && i < held.size(); ++i) {
            consistent = committed[i].analysis.code == held[i].codon;
        }
        consistent = consistent && raced.diversity().exact_value() == 1024;
        if (!consistent) ++stale;
    }
    expect(stale == 0, std::to_string(stale) + " round(s) committed results for stale codons", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_library_size();
    total += test_position_edits();
    total += test_recalculate();
    total += test_recommendations_and_export();
    total += test_concurrent_edits();

    if (total == 0) {
        std::cout << "\nAll library tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
