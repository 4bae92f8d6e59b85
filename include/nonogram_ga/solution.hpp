/**
 * @file solution.hpp
 * @brief 解盤面クラス
 */
#ifndef NONOGRAM_GA_SOLUTION_HPP
#define NONOGRAM_GA_SOLUTION_HPP

#include "nonogram_ga/segment.hpp"
#include <vector>
#include <string>

namespace nonogram_ga {

/**
 * @brief 行優先の色グリッド
 */
using Grid = std::vector<Line>;

/**
 * @brief 候補解（染色済みの長方形グリッド）
 *
 * 遺伝的アルゴリズムの染色体でもある。行制約・列制約は
 * 各行・各列のランレングス符号化によりいつでも導出できる。
 */
class Solution {
public:
    /**
     * @brief 空の解（0行）を作成
     */
    Solution() = default;

    /**
     * @brief グリッドから解を作成
     * @throws std::invalid_argument 行の長さが揃っていない場合
     */
    explicit Solution(Grid grid);

    /**
     * @brief 全セルが背景色の解を作成
     */
    static Solution blank(size_t rows, size_t cols);

    /**
     * @brief 行数を取得
     */
    size_t rows() const { return grid_.size(); }

    /**
     * @brief 列数を取得
     * @throws std::logic_error 行が1つもない場合
     */
    size_t cols() const;

    /**
     * @brief グリッドへの参照を取得
     */
    const Grid& grid() const { return grid_; }

    /**
     * @brief 行への参照を取得
     */
    const Line& row(size_t r) const { return grid_[r]; }
    Line& row(size_t r) { return grid_[r]; }

    /**
     * @brief セルの色を取得
     */
    Color at(size_t r, size_t c) const { return grid_[r][c]; }

    /**
     * @brief セルの色を設定
     */
    void set(size_t r, size_t c, Color color) { grid_[r][c] = color; }

    /**
     * @brief 各行をランレングス符号化した行制約
     */
    Constraints row_constraints() const;

    /**
     * @brief 各列をランレングス符号化した列制約
     */
    Constraints col_constraints() const;

    /**
     * @brief 行ごとに1行、セルを空白区切りで並べた文字列
     */
    std::string to_string() const;

    bool operator==(const Solution& other) const { return grid_ == other.grid_; }
    bool operator!=(const Solution& other) const { return grid_ != other.grid_; }

private:
    Grid grid_;
};

} // namespace nonogram_ga

#endif // NONOGRAM_GA_SOLUTION_HPP
