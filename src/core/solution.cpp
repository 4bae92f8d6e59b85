#include "nonogram_ga/solution.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace nonogram_ga {

Solution::Solution(Grid grid)
    : grid_(std::move(grid)) {
    for (size_t r = 1; r < grid_.size(); ++r) {
        if (grid_[r].size() != grid_[0].size()) {
            throw std::invalid_argument("Ragged solution grid: row " + std::to_string(r)
                                        + " has " + std::to_string(grid_[r].size())
                                        + " cells, expected " + std::to_string(grid_[0].size()));
        }
    }
}

Solution Solution::blank(size_t rows, size_t cols) {
    return Solution(Grid(rows, Line(cols, BACKGROUND)));
}

size_t Solution::cols() const {
    if (grid_.empty()) {
        throw std::logic_error("The nonogram solution has zero rows");
    }
    return grid_[0].size();
}

Constraints Solution::row_constraints() const {
    Constraints constraints;
    constraints.reserve(grid_.size());
    for (const auto& line : grid_) {
        constraints.push_back(encode_line(line));
    }
    return constraints;
}

Constraints Solution::col_constraints() const {
    Constraints constraints;
    if (grid_.empty()) {
        return constraints;
    }
    size_t n_cols = cols();
    constraints.reserve(n_cols);

    // 列方向に走査するためバッファを使い回す
    Line column(grid_.size());
    for (size_t c = 0; c < n_cols; ++c) {
        for (size_t r = 0; r < grid_.size(); ++r) {
            column[r] = grid_[r][c];
        }
        constraints.push_back(encode_line(column));
    }
    return constraints;
}

std::string Solution::to_string() const {
    std::ostringstream oss;
    for (const auto& line : grid_) {
        bool first = true;
        for (Color color : line) {
            if (!first) oss << ' ';
            first = false;
            oss << color;
        }
        oss << '\n';
    }
    return oss.str();
}

} // namespace nonogram_ga
