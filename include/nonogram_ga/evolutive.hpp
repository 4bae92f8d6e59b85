/**
 * @file evolutive.hpp
 * @brief 進化的探索（トーナメント選択、エリート保存、世代履歴）
 */
#ifndef NONOGRAM_GA_EVOLUTIVE_HPP
#define NONOGRAM_GA_EVOLUTIVE_HPP

#include "nonogram_ga/puzzle.hpp"
#include "nonogram_ga/solution.hpp"
#include "nonogram_ga/random.hpp"
#include <atomic>
#include <vector>

namespace nonogram_ga {

/**
 * @brief スコア付きの個体
 */
struct ScoredSolution {
    Solution solution;
    size_t score;
};

/**
 * @brief 個体群（スコア昇順に整列済み、0 は完全一致）
 */
using Population = std::vector<ScoredSolution>;

/**
 * @brief 探索の状態
 */
enum class SearchStatus {
    Running,    // 探索中
    Won,        // スコア 0 に到達
    Exhausted,  // 反復回数の上限に到達
    Stopped     // stop() により中断
};

/**
 * @brief 探索パラメータ
 */
struct SearchParams {
    size_t population_size = 500;
    double cross_probability = 0.6;
    double mutation_probability = 0.1;
    size_t tournament_size = 3;
    size_t slide_tries = 3;
    size_t max_iterations = 300;

    /**
     * @brief 値域を検査
     * @throws std::invalid_argument 確率が [0, 1] 外、個体数 0、トーナメントサイズ 0
     */
    void validate() const;
};

/**
 * @brief 世代ごとの記録
 *
 * best / worst は各世代の最良・最悪スコア、median は中央値
 * （偶数個体数なら中央2個の平均）。
 * status が Won なら solution はスコア 0 の解、それ以外は最終世代の最良解。
 * 収束しなかったことはエラーではなく、このデータとして報告される。
 */
struct History {
    size_t iterations = 0;
    std::vector<size_t> best;
    std::vector<double> median;
    std::vector<size_t> worst;
    SearchStatus status = SearchStatus::Running;
    Solution solution;

    /**
     * @brief スコア 0 の解が見つかったか
     */
    bool solved() const { return status == SearchStatus::Won; }

    /**
     * @brief 現世代の最良・中央・最悪スコアを追記
     * @pre population はスコア昇順で空でないこと
     */
    void push(const Population& population);

    /**
     * @brief 整列済み個体群の中央スコア
     */
    static double get_median(const Population& population);
};

/**
 * @brief 探索統計情報
 */
struct SearchStats {
    size_t generations = 0;
    size_t evaluations = 0;
    size_t uniform_crosses = 0;
    size_t two_point_crosses = 0;
    size_t slides = 0;
};

/**
 * @brief トーナメント選択
 *
 * 個体群から k 個体を重複なしに一様抽出し、最小スコアの個体を返す
 * （同点は先に抽出された方）。k が個体数以上なら全個体が参加する。
 *
 * @throws std::invalid_argument 個体群が空、または k が 0 の場合
 */
const Solution& tournament_selection(const Population& population,
                                     size_t tournament_size,
                                     Rng& rng);

/**
 * @brief (μ+λ) エリート保存
 *
 * 子を採点して現個体群に連結し、スコア昇順に安定整列して元の個体数に切り詰める。
 */
Population preserve_elite_population(const Puzzle& puzzle,
                                     Population population,
                                     std::vector<Solution> offspring);

/**
 * @brief 遺伝的アルゴリズムによるノノグラムソルバー
 *
 * 単一スレッドで同期的に動作する。乱数は solve() に渡された生成器だけを使う。
 */
class EvolutiveSolver {
public:
    EvolutiveSolver() = default;

    /**
     * @brief パラメータを指定して作成
     * @throws std::invalid_argument パラメータが不正な場合
     */
    explicit EvolutiveSolver(SearchParams params);

    /**
     * @brief 探索を実行
     *
     * 各世代の先頭で履歴を追記し、最良スコアが 0 なら終了する。
     * それ以外は子を生成・突然変異させ、エリート保存で次世代を作る。
     *
     * @param puzzle 解くパズル
     * @param rng 乱数生成器
     * @return 探索履歴
     */
    History solve(const Puzzle& puzzle, Rng& rng);

    /**
     * @brief パラメータを取得
     */
    const SearchParams& params() const { return params_; }

    /**
     * @brief パラメータを設定
     * @throws std::invalid_argument パラメータが不正な場合
     */
    void set_params(SearchParams params);

    /**
     * @brief 統計情報を取得
     */
    const SearchStats& stats() const { return stats_; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    bool is_verbose() const { return verbose_; }

private:
    /**
     * @brief 初期個体群を生成して採点・整列
     */
    Population initial_population(const Puzzle& puzzle, Rng& rng);

    /**
     * @brief トーナメント選択と交叉で子を個体数分生成
     */
    std::vector<Solution> recombinate_population(const Puzzle& puzzle,
                                                 const Population& population,
                                                 Rng& rng);

    /**
     * @brief 全ての子にスライド突然変異を適用
     */
    void mutate_population(const Puzzle& puzzle,
                           std::vector<Solution>& offspring,
                           Rng& rng);

    SearchParams params_;
    SearchStats stats_;
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;
};

/**
 * @brief 進化的探索を1回実行する
 */
History evolutive_search(size_t population_size,
                         const Puzzle& puzzle,
                         double cross_probability,
                         double mutation_probability,
                         size_t tournament_size,
                         size_t slide_tries,
                         size_t max_iterations,
                         Rng& rng);

/**
 * @brief デフォルトパラメータと DEFAULT_SEED でパズルを解く
 */
History solve_nonogram(const Puzzle& puzzle);

/**
 * @brief 状態名（"won" など）
 */
const char* to_string(SearchStatus status);

} // namespace nonogram_ga

#endif // NONOGRAM_GA_EVOLUTIVE_HPP
