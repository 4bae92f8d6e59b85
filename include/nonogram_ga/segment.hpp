/**
 * @file segment.hpp
 * @brief セグメント（色付きラン）と行・列制約の表現
 */
#ifndef NONOGRAM_GA_SEGMENT_HPP
#define NONOGRAM_GA_SEGMENT_HPP

#include <vector>
#include <string>
#include <cstddef>

namespace nonogram_ga {

/**
 * @brief パレット上の色インデックス（0 は背景）
 */
using Color = size_t;

/// 背景色
constexpr Color BACKGROUND = 0;

/**
 * @brief 1本のラインを構成する色の列
 */
using Line = std::vector<Color>;

/**
 * @brief 同一色の最大連続区間
 *
 * color は非ゼロ、length は正。
 */
struct Segment {
    Color color = BACKGROUND;
    size_t length = 0;

    bool operator==(const Segment& other) const {
        return color == other.color && length == other.length;
    }
    bool operator!=(const Segment& other) const {
        return !(*this == other);
    }
};

/**
 * @brief 1本のラインの制約（左から順のセグメント列）
 */
using LineConstraints = std::vector<Segment>;

/**
 * @brief 全ラインの制約
 */
using Constraints = std::vector<LineConstraints>;

/**
 * @brief ラインをランレングス符号化する
 *
 * 背景色のランはセグメントを生成せず、直前のランを閉じるだけ。
 */
LineConstraints encode_line(const Line& line);

/**
 * @brief 制約を満たすのに必要な最小幅
 *
 * セグメント長の合計 + 隣接する同色セグメント間の必須区切り数。
 */
size_t minimum_width(const LineConstraints& segments);

/**
 * @brief 隣接する同色セグメントの組の数（必須区切りの数）
 */
size_t required_separators(const LineConstraints& segments);

/**
 * @brief "1x3 2x1" 形式の文字列表現
 */
std::string to_string(const LineConstraints& segments);

} // namespace nonogram_ga

#endif // NONOGRAM_GA_SEGMENT_HPP
