/**
 * @file genetic.hpp
 * @brief 行制約を保存する遺伝的操作（交叉・スライド突然変異）
 *
 * どの操作も行を丸ごと組み替えるか、行内のランを1セルずらすだけなので、
 * 修復処理なしで行制約が保たれる。
 */
#ifndef NONOGRAM_GA_GENETIC_HPP
#define NONOGRAM_GA_GENETIC_HPP

#include "nonogram_ga/puzzle.hpp"
#include "nonogram_ga/solution.hpp"
#include "nonogram_ga/random.hpp"
#include <utility>
#include <vector>

namespace nonogram_ga {

/**
 * @brief 交換すると1つのランが1セル移動する位置の組
 *
 * 常に（ランの一端に隣接する背景セル, そのランの反対側の端のセル）。
 */
using Slide = std::pair<size_t, size_t>;

/**
 * @brief 交叉で生成される子の組
 */
using Descendants = std::pair<Solution, Solution>;

/**
 * @brief 一様交叉
 *
 * 各行について確率 cross_probability で a1 の行を c1 に、a2 の行を c2 に写し、
 * それ以外は入れ替えて写す。
 *
 * @throws MismatchedDimensions 祖先の行数がパズルと異なる場合
 */
Descendants uniform_cross(const Puzzle& puzzle,
                          const Solution& ancestor_1,
                          const Solution& ancestor_2,
                          double cross_probability,
                          Rng& rng);

/**
 * @brief 二点交叉
 *
 * 確率 1 - cross_probability で親の複製をそのまま返す。それ以外は
 * point_1 <= point_2 を引き、行インデックスが [point_1, point_2] の行を入れ替える。
 *
 * @note 分割点は列数の範囲 [1, cols - 2] から引き、行インデックスに適用する。
 *       cols < 3 のときは内部の分割点が存在しないため親の複製を返す。
 * @throws MismatchedDimensions 祖先の行数がパズルと異なる場合
 */
Descendants two_point_cross(const Puzzle& puzzle,
                            const Solution& ancestor_1,
                            const Solution& ancestor_2,
                            double cross_probability,
                            Rng& rng);

/**
 * @brief スライド突然変異
 *
 * 各行で slide_tries 回の試行を行い、各試行で確率 mutation_probability で
 * get_slidables() の結果から一様に1組を選んで交換する。
 *
 * @return 実際に適用したスライドの数
 */
size_t chromosome_mutation(const Puzzle& puzzle,
                           Solution& candidate,
                           double mutation_probability,
                           size_t slide_tries,
                           Rng& rng);

/**
 * @brief 行内でスライド可能な位置の組を列挙
 *
 * 左から右への1回の走査で、同色ランとの結合が起こるスライドは
 * 左右どちらの側でも除外する。
 */
std::vector<Slide> get_slidables(const Line& row);

} // namespace nonogram_ga

#endif // NONOGRAM_GA_GENETIC_HPP
