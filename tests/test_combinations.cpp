// k-subset enumeration tests

#include "degen/combinations.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

std::string join(const std::vector<std::vector<char>>& subsets) {
    std::string out;
    for (const auto& s : subsets) {
        if (!out.empty()) out += ' ';
        out.append(s.begin(), s.end());
    }
    return out;
}

int test_enumeration_order() {
    std::cout << "[combinations] lexicographic enumeration\n";
    int failed = 0;
    const std::vector<char> items = {'A', 'C', 'G', 'T'};

    expect(join(degen::combinations(items, 1)) == "A C G T", "k=1", failed);
    expect(join(degen::combinations(items, 2)) == "AC AG AT CG CT GT", "k=2", failed);
    expect(join(degen::combinations(items, 3)) == "ACG ACT AGT CGT", "k=3", failed);
    expect(join(degen::combinations(items, 4)) == "ACGT", "k=n", failed);

    // Input order is kept inside each subset
    const std::vector<char> reversed = {'T', 'G', 'C'};
    expect(join(degen::combinations(reversed, 2)) == "TG TC GC", "input order kept", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_edge_cases() {
    std::cout << "[combinations] edge cases\n";
    int failed = 0;
    const std::vector<int> items = {1, 2, 3};

    expect(degen::combinations(items, 4).empty(), "k > n yields nothing", failed);
    const auto zero = degen::combinations(items, 0);
    expect(zero.size() == 1 && zero[0].empty(), "k = 0 yields one empty subset", failed);
    expect(degen::combinations(std::vector<int>{}, 1).empty(), "empty input", failed);

    // C(4, k) sizes
    const std::vector<int> four = {1, 2, 3, 4};
    const size_t expected[] = {1, 4, 6, 4, 1};
    for (size_t k = 0; k <= 4; ++k) {
        expect(degen::combinations(four, k).size() == expected[k],
               "C(4," + std::to_string(k) + ")", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_enumeration_order();
    total += test_edge_cases();

    if (total == 0) {
        std::cout << "\nAll combination tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
