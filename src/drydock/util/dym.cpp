#include "./dym.hpp"

#include <numeric>
#include <vector>

std::size_t drydock::lev_edit_distance(std::string_view a, std::string_view b) noexcept {
    // Two rolling rows of the Wagner-Fischer matrix
    std::vector<std::size_t> prev(a.size() + 1);
    std::vector<std::size_t> cur(a.size() + 1);
    std::iota(prev.begin(), prev.end(), std::size_t(0));

    for (std::size_t row = 1; row <= b.size(); ++row) {
        cur[0] = row;
        for (std::size_t col = 1; col <= a.size(); ++col) {
            const auto cost = a[col - 1] == b[row - 1] ? 0u : 1u;
            cur[col]        = std::min({prev[col] + 1, cur[col - 1] + 1, prev[col - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev.back();
}
