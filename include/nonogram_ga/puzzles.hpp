/**
 * @file puzzles.hpp
 * @brief 組み込みパズル
 */
#ifndef NONOGRAM_GA_PUZZLES_HPP
#define NONOGRAM_GA_PUZZLES_HPP

#include "nonogram_ga/puzzle.hpp"
#include "nonogram_ga/solution.hpp"
#include <optional>
#include <string>
#include <vector>

namespace nonogram_ga {
namespace puzzles {

/// tree パズルの葉の色
constexpr Color LEAVES = 1;
/// tree パズルの幹の色
constexpr Color WOOD = 2;

/**
 * @brief 5x5 の木（葉と幹の2色）。制約は手書きの表。
 */
Puzzle tree_puzzle();

/**
 * @brief tree パズルの正解盤面
 */
Solution tree_solution();

/**
 * @brief 組み込みパズルの名前一覧
 */
const std::vector<std::string>& puzzle_names();

/**
 * @brief 名前からパズルを取得
 */
std::optional<Puzzle> find_puzzle(const std::string& name);

/**
 * @brief 名前から正解盤面を取得
 */
std::optional<Solution> find_solution(const std::string& name);

} // namespace puzzles
} // namespace nonogram_ga

#endif // NONOGRAM_GA_PUZZLES_HPP
