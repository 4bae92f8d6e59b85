/**
 * @file random.hpp
 * @brief 乱数生成器の型と共通ヘルパー
 */
#ifndef NONOGRAM_GA_RANDOM_HPP
#define NONOGRAM_GA_RANDOM_HPP

#include <random>
#include <cstddef>

namespace nonogram_ga {

/**
 * @brief 探索全体で使用する乱数生成器
 *
 * グローバルな生成器は持たず、乱数を消費する関数は全てこの型の参照を受け取る。
 * 同じシードからは同じ探索結果が得られる。
 */
using Rng = std::mt19937;

/// solve_nonogram() で使用するデフォルトシード
constexpr Rng::result_type DEFAULT_SEED = 23;

/**
 * @brief 確率 p で true を返す
 * @pre 0 <= p <= 1
 */
inline bool gen_bool(Rng& rng, double p) {
    std::bernoulli_distribution dist(p);
    return dist(rng);
}

/**
 * @brief [lo, hi] の一様整数を返す
 * @pre lo <= hi
 */
inline size_t gen_range(Rng& rng, size_t lo, size_t hi) {
    std::uniform_int_distribution<size_t> dist(lo, hi);
    return dist(rng);
}

} // namespace nonogram_ga

#endif // NONOGRAM_GA_RANDOM_HPP
