#include "nonogram_ga/genetic.hpp"
#include "nonogram_ga/error.hpp"
#include <optional>
#include <utility>

namespace nonogram_ga {

namespace {

void check_ancestors(const Puzzle& puzzle, const Solution& ancestor_1, const Solution& ancestor_2) {
    puzzle.check_dimensions(ancestor_1, "first ancestor");
    puzzle.check_dimensions(ancestor_2, "second ancestor");
}

}  // namespace

Descendants uniform_cross(const Puzzle& puzzle,
                          const Solution& ancestor_1,
                          const Solution& ancestor_2,
                          double cross_probability,
                          Rng& rng) {
    check_ancestors(puzzle, ancestor_1, ancestor_2);

    Grid descendant_1;
    Grid descendant_2;
    descendant_1.reserve(puzzle.rows());
    descendant_2.reserve(puzzle.rows());

    for (size_t i = 0; i < puzzle.rows(); ++i) {
        if (gen_bool(rng, cross_probability)) {
            descendant_1.push_back(ancestor_1.row(i));
            descendant_2.push_back(ancestor_2.row(i));
        } else {
            descendant_2.push_back(ancestor_1.row(i));
            descendant_1.push_back(ancestor_2.row(i));
        }
    }
    return {Solution(std::move(descendant_1)), Solution(std::move(descendant_2))};
}

Descendants two_point_cross(const Puzzle& puzzle,
                            const Solution& ancestor_1,
                            const Solution& ancestor_2,
                            double cross_probability,
                            Rng& rng) {
    check_ancestors(puzzle, ancestor_1, ancestor_2);

    if (!gen_bool(rng, cross_probability) || puzzle.cols() < 3) {
        return {ancestor_1, ancestor_2};
    }

    // 分割点は列数の範囲から引き、行インデックスに適用する
    size_t point_1 = gen_range(rng, 1, puzzle.cols() - 2);
    size_t point_2 = gen_range(rng, 1, puzzle.cols() - 2);
    if (point_1 > point_2) {
        std::swap(point_1, point_2);
    }

    Grid descendant_1;
    Grid descendant_2;
    descendant_1.reserve(puzzle.rows());
    descendant_2.reserve(puzzle.rows());

    for (size_t i = 0; i < puzzle.rows(); ++i) {
        if (i < point_1 || i > point_2) {
            descendant_1.push_back(ancestor_1.row(i));
            descendant_2.push_back(ancestor_2.row(i));
        } else {
            descendant_2.push_back(ancestor_1.row(i));
            descendant_1.push_back(ancestor_2.row(i));
        }
    }
    return {Solution(std::move(descendant_1)), Solution(std::move(descendant_2))};
}

size_t chromosome_mutation(const Puzzle& puzzle,
                           Solution& candidate,
                           double mutation_probability,
                           size_t slide_tries,
                           Rng& rng) {
    puzzle.check_dimensions(candidate, "mutated candidate");

    size_t applied = 0;
    for (size_t r = 0; r < candidate.rows(); ++r) {
        Line& row = candidate.row(r);
        for (size_t t = 0; t < slide_tries; ++t) {
            if (!gen_bool(rng, mutation_probability)) {
                continue;
            }
            auto slidables = get_slidables(row);
            if (slidables.empty()) {
                continue;
            }
            const auto& slide = slidables[gen_range(rng, 0, slidables.size() - 1)];
            std::swap(row[slide.first], row[slide.second]);
            ++applied;
        }
    }
    return applied;
}

std::vector<Slide> get_slidables(const Line& row) {
    std::vector<Slide> slidables;
    if (row.empty()) {
        return slidables;
    }

    Color previous_color = row[0];
    // 背景で閉じられた直前のランの色
    std::optional<Color> previous_segment_color;
    // ランの左側にある背景ランの終端
    std::optional<size_t> background_end;
    std::optional<size_t> segment_start;
    if (previous_color != BACKGROUND) {
        segment_start = 0;
    }

    for (size_t i = 1; i < row.size(); ++i) {
        Color current_color = row[i];

        if (previous_color == BACKGROUND && current_color != BACKGROUND) {
            // ラン開始。左へずらすと同色ランと結合するなら候補にしない
            background_end = i - 1;
            segment_start = i;
            if (previous_segment_color && *previous_segment_color == current_color) {
                background_end.reset();
            }
        } else if (previous_color != BACKGROUND && current_color == BACKGROUND) {
            // ラン終了
            previous_segment_color = previous_color;
            if (background_end) {
                slidables.emplace_back(*background_end, i - 1);
                background_end.reset();
            }
            // 右へずらしても右隣の同色ランと結合しない場合のみ
            if (i + 1 >= row.size() || row[i + 1] != previous_color) {
                slidables.emplace_back(segment_start.value(), i);
            }
            segment_start.reset();
        } else if (previous_color != current_color) {
            // 隙間なしで隣接する異色ラン
            if (background_end) {
                slidables.emplace_back(*background_end, i - 1);
                background_end.reset();
            }
            segment_start = i;
        }
        previous_color = current_color;
    }

    if (background_end) {
        slidables.emplace_back(*background_end, row.size() - 1);
    }
    return slidables;
}

} // namespace nonogram_ga
