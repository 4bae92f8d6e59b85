/**
 * @file puzzle.hpp
 * @brief カラーノノグラムのパズル定義（サイズと行・列制約）
 */
#ifndef NONOGRAM_GA_PUZZLE_HPP
#define NONOGRAM_GA_PUZZLE_HPP

#include "nonogram_ga/segment.hpp"
#include "nonogram_ga/solution.hpp"
#include "nonogram_ga/random.hpp"

namespace nonogram_ga {

/**
 * @brief カラーノノグラムのパズル
 *
 * 構築後は読み取り専用。探索エンジンは値として受け取る。
 * 行制約と列制約の間の矛盾は検査しない（その場合スコアが 0 に到達しないだけ）。
 */
class Puzzle {
public:
    /**
     * @brief パズルを作成
     * @param rows 行数
     * @param cols 列数
     * @param row_constraints 各行の制約（rows 個）
     * @param col_constraints 各列の制約（cols 個）
     * @throws std::invalid_argument サイズが 0、制約数の不一致、
     *         色 0 または長さ 0 のセグメント、ラインに収まらない制約
     */
    Puzzle(size_t rows, size_t cols,
           Constraints row_constraints, Constraints col_constraints);

    /**
     * @brief 解盤面から行・列制約を導出してパズルを作成
     */
    static Puzzle from_solution(const Solution& solution);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    const Constraints& row_constraints() const { return row_constraints_; }
    const Constraints& col_constraints() const { return col_constraints_; }

    /**
     * @brief 全セル背景色の盤面
     */
    Solution empty_solution() const;

    /**
     * @brief 行制約を必ず満たすランダムな染色体を生成
     *
     * 各行について余白 slack = cols - 最小幅 を計算し、各セグメントの前に
     * 確率 1/2 で [0, slack] の一様な長さの背景を挿入する。
     * 同色セグメントが続く場合は必須の区切りを1つ置く（slack からは引かない）。
     * 残った slack は末尾の背景になる。
     */
    Solution new_chromosome_solution(Rng& rng) const;

    /**
     * @brief 候補解の列制約と目標列制約との距離
     *
     * 各列でセグメント列を末尾揃えにし、短い方の先頭を色 0・長さ 0 で埋める。
     * 同色なら |len_a - len_b|、異色なら len_a + len_b を加算する。
     * 行制約は構成上常に満たされるので、0 は完全解を意味する。
     *
     * @throws MismatchedDimensions 候補解のサイズがパズルと異なる場合
     */
    size_t score(const Solution& candidate) const;

    /**
     * @brief 盤面のサイズがパズルと一致することを確認
     * @param what 例外メッセージに含める対象名
     * @throws MismatchedDimensions 一致しない場合
     */
    void check_dimensions(const Solution& candidate, const char* what) const;

private:
    void validate() const;

    size_t rows_;
    size_t cols_;
    Constraints row_constraints_;
    Constraints col_constraints_;
};

} // namespace nonogram_ga

#endif // NONOGRAM_GA_PUZZLE_HPP
