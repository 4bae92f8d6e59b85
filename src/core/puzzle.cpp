#include "nonogram_ga/puzzle.hpp"
#include "nonogram_ga/error.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace nonogram_ga {

namespace {

void validate_lines(const Constraints& lines, size_t line_size, const char* kind) {
    for (size_t i = 0; i < lines.size(); ++i) {
        for (const auto& seg : lines[i]) {
            if (seg.color == BACKGROUND) {
                throw std::invalid_argument(std::string(kind) + " " + std::to_string(i)
                                            + ": segment with background color");
            }
            if (seg.length == 0) {
                throw std::invalid_argument(std::string(kind) + " " + std::to_string(i)
                                            + ": segment with zero length");
            }
        }
        size_t width = minimum_width(lines[i]);
        if (width > line_size) {
            throw std::invalid_argument(std::string(kind) + " " + std::to_string(i)
                                        + ": constraints need " + std::to_string(width)
                                        + " cells but the line has " + std::to_string(line_size));
        }
    }
}

}  // namespace

Puzzle::Puzzle(size_t rows, size_t cols,
               Constraints row_constraints, Constraints col_constraints)
    : rows_(rows)
    , cols_(cols)
    , row_constraints_(std::move(row_constraints))
    , col_constraints_(std::move(col_constraints)) {
    validate();
}

void Puzzle::validate() const {
    if (rows_ == 0 || cols_ == 0) {
        throw std::invalid_argument("Puzzle dimensions must be positive, got "
                                    + std::to_string(rows_) + "x" + std::to_string(cols_));
    }
    if (row_constraints_.size() != rows_) {
        throw std::invalid_argument("Expected " + std::to_string(rows_) + " row constraints, got "
                                    + std::to_string(row_constraints_.size()));
    }
    if (col_constraints_.size() != cols_) {
        throw std::invalid_argument("Expected " + std::to_string(cols_) + " column constraints, got "
                                    + std::to_string(col_constraints_.size()));
    }
    validate_lines(row_constraints_, cols_, "row");
    validate_lines(col_constraints_, rows_, "column");
}

Puzzle Puzzle::from_solution(const Solution& solution) {
    return Puzzle(solution.rows(), solution.cols(),
                  solution.row_constraints(), solution.col_constraints());
}

Solution Puzzle::empty_solution() const {
    return Solution::blank(rows_, cols_);
}

Solution Puzzle::new_chromosome_solution(Rng& rng) const {
    Grid grid;
    grid.reserve(rows_);

    for (const auto& segments : row_constraints_) {
        size_t remaining_spaces = cols_ - minimum_width(segments);
        Line row;
        row.reserve(cols_);

        for (size_t i = 0; i < segments.size(); ++i) {
            const auto& seg = segments[i];
            if (gen_bool(rng, 0.5)) {
                size_t gap_size = gen_range(rng, 0, remaining_spaces);
                remaining_spaces -= gap_size;
                row.insert(row.end(), gap_size, BACKGROUND);
            }
            row.insert(row.end(), seg.length, seg.color);

            // 同色が続く場合の必須区切り（slack からは引かない）
            if (i + 1 < segments.size() && segments[i + 1].color == seg.color) {
                row.push_back(BACKGROUND);
            }
        }
        row.insert(row.end(), remaining_spaces, BACKGROUND);
        grid.push_back(std::move(row));
    }
    return Solution(std::move(grid));
}

void Puzzle::check_dimensions(const Solution& candidate, const char* what) const {
    size_t actual_rows = candidate.rows();
    size_t actual_cols = actual_rows == 0 ? 0 : candidate.cols();
    if (actual_rows != rows_ || actual_cols != cols_) {
        throw MismatchedDimensions(what, rows_, cols_, actual_rows, actual_cols);
    }
}

size_t Puzzle::score(const Solution& candidate) const {
    check_dimensions(candidate, "scored candidate");

    auto current_constraints = candidate.col_constraints();
    size_t total = 0;

    for (size_t c = 0; c < cols_; ++c) {
        const auto& current = current_constraints[c];
        const auto& expected = col_constraints_[c];
        size_t len = std::max(current.size(), expected.size());
        size_t current_pad = len - current.size();
        size_t expected_pad = len - expected.size();

        // 末尾揃え: 足りない先頭は色 0・長さ 0 のセグメントとみなす
        for (size_t k = 0; k < len; ++k) {
            Segment cur = k < current_pad ? Segment{} : current[k - current_pad];
            Segment exp = k < expected_pad ? Segment{} : expected[k - expected_pad];
            if (cur.color == exp.color) {
                total += cur.length > exp.length ? cur.length - exp.length
                                                 : exp.length - cur.length;
            } else {
                total += cur.length + exp.length;
            }
        }
    }
    return total;
}

} // namespace nonogram_ga
