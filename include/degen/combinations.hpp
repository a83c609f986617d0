#pragma once

#include <cstddef>
#include <vector>

namespace degen {

/**
 * All k-element subsets of `items`, lexicographic by index. Elements inside
 * each subset keep their input order. Callers pass at most 4 items.
 */
template <typename T>
std::vector<std::vector<T>> combinations(const std::vector<T>& items, size_t k) {
    std::vector<std::vector<T>> out;
    const size_t n = items.size();
    if (k > n) return out;

    if (k == 0) {
        out.emplace_back();
        return out;
    }
    if (k == 1) {
        out.reserve(n);
        for (const T& item : items) out.push_back({item});
        return out;
    }
    if (k == n) {
        out.push_back(items);
        return out;
    }

    std::vector<T> current;
    current.reserve(k);

    // Backtracking over index positions
    auto recurse = [&](auto&& self, size_t start, size_t depth) -> void {
        if (depth == k) {
            out.push_back(current);
            return;
        }
        for (size_t i = start; i + (k - depth) <= n; ++i) {
            current.push_back(items[i]);
            self(self, i + 1, depth + 1);
            current.pop_back();
        }
    };
    recurse(recurse, 0, 0);
    return out;
}

}  // namespace degen
