/**
 * @file anova.hpp
 * @brief ハイパーパラメータとシードのグリッド探索
 */
#ifndef NONOGRAM_GA_ANOVA_HPP
#define NONOGRAM_GA_ANOVA_HPP

#include "nonogram_ga/evolutive.hpp"
#include "nonogram_ga/puzzle.hpp"
#include <optional>
#include <vector>

namespace nonogram_ga {

/**
 * @brief 探索するパラメータの格子
 *
 * 交叉確率・突然変異確率・スライド試行回数・シードの直積を全て試す。
 * 個体数・トーナメントサイズ・反復回数は固定。
 */
struct AnovaGrid {
    std::vector<double> cross_probabilities{0.3, 0.6, 0.9};
    std::vector<double> mutation_probabilities{0.1, 0.2, 0.3};
    std::vector<size_t> slide_tries{3, 5, 7};
    std::vector<Rng::result_type> seeds{11, 13, 17, 19, 23, 29, 31, 37, 41, 43};
    size_t population_size = 500;
    size_t tournament_size = 3;
    size_t max_iterations = 300;

    /**
     * @brief 組み合わせの総数
     */
    size_t combinations() const {
        return cross_probabilities.size() * mutation_probabilities.size()
             * slide_tries.size() * seeds.size();
    }
};

/**
 * @brief 1組み合わせの試行結果
 */
struct AnovaTrial {
    SearchParams params;
    Rng::result_type seed;
    size_t best_score;
    size_t iterations;
    SearchStatus status;
};

/**
 * @brief グリッド探索の結果
 *
 * best は最終最良スコアが最小の試行（同点は先に試したもの）。
 * スコア 0 に到達しなかった場合も best には最良の試行が入る。
 */
struct AnovaResult {
    std::vector<AnovaTrial> trials;
    std::optional<AnovaTrial> best;

    /**
     * @brief いずれかの組み合わせがスコア 0 に到達したか
     */
    bool solved() const { return best && best->best_score == 0; }
};

/**
 * @brief グリッド探索を実行
 *
 * 各組み合わせで solver のパラメータを設定し、そのシードの生成器で1回探索する。
 * solver が停止された時点で残りの組み合わせは実行しない。
 * solver の verbose 設定に従って各試行を std::cerr に出力する。
 */
AnovaResult anova(const Puzzle& puzzle, const AnovaGrid& grid, EvolutiveSolver& solver);

/**
 * @brief デフォルトの格子でグリッド探索を実行
 */
AnovaResult anova(const Puzzle& puzzle);

} // namespace nonogram_ga

#endif // NONOGRAM_GA_ANOVA_HPP
