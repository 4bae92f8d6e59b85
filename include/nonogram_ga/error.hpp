/**
 * @file error.hpp
 * @brief エンジンが投げる例外型
 */
#ifndef NONOGRAM_GA_ERROR_HPP
#define NONOGRAM_GA_ERROR_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace nonogram_ga {

/**
 * @brief 盤面サイズがパズルと一致しない
 *
 * 交叉の祖先や採点対象の行数・列数がパズルと異なる場合に投げられる。
 */
class MismatchedDimensions : public std::invalid_argument {
public:
    MismatchedDimensions(const std::string& what,
                         size_t expected_rows, size_t expected_cols,
                         size_t actual_rows, size_t actual_cols);

    size_t expected_rows() const { return expected_rows_; }
    size_t expected_cols() const { return expected_cols_; }
    size_t actual_rows() const { return actual_rows_; }
    size_t actual_cols() const { return actual_cols_; }

private:
    size_t expected_rows_;
    size_t expected_cols_;
    size_t actual_rows_;
    size_t actual_cols_;
};

} // namespace nonogram_ga

#endif // NONOGRAM_GA_ERROR_HPP
