#include "nonogram_ga/puzzles.hpp"

namespace nonogram_ga {
namespace puzzles {

namespace {

constexpr size_t TREE_ROWS = 5;
constexpr size_t TREE_COLS = 5;

Solution heart_solution() {
    return Solution(Grid{
        {0, 1, 1, 0, 1, 1, 0},
        {1, 1, 1, 1, 1, 1, 1},
        {1, 1, 1, 1, 1, 1, 1},
        {1, 1, 1, 1, 1, 1, 1},
        {0, 1, 1, 1, 1, 1, 0},
        {0, 0, 1, 1, 1, 0, 0},
        {0, 0, 0, 1, 0, 0, 0},
    });
}

// 1: 傘, 2: 斑点, 3: 柄
Solution mushroom_solution() {
    return Solution(Grid{
        {0, 1, 1, 1, 1, 0},
        {1, 2, 1, 1, 2, 1},
        {1, 1, 1, 1, 1, 1},
        {0, 0, 3, 3, 0, 0},
        {0, 0, 3, 3, 0, 0},
        {0, 3, 3, 3, 3, 0},
    });
}

}  // namespace

Puzzle tree_puzzle() {
    return Puzzle(
        TREE_ROWS, TREE_COLS,
        {
            {{LEAVES, 3}},
            {{LEAVES, 5}},
            {{LEAVES, 2}, {WOOD, 1}, {LEAVES, 2}},
            {{WOOD, 1}},
            {{WOOD, 1}},
        },
        {
            {{LEAVES, 2}},
            {{LEAVES, 3}},
            {{LEAVES, 2}, {WOOD, 3}},
            {{LEAVES, 3}},
            {{LEAVES, 2}},
        });
}

Solution tree_solution() {
    return Solution(Grid{
        {0, 1, 1, 1, 0},
        {1, 1, 1, 1, 1},
        {1, 1, 2, 1, 1},
        {0, 0, 2, 0, 0},
        {0, 0, 2, 0, 0},
    });
}

const std::vector<std::string>& puzzle_names() {
    static const std::vector<std::string> names{"tree", "heart", "mushroom"};
    return names;
}

std::optional<Solution> find_solution(const std::string& name) {
    if (name == "tree") return tree_solution();
    if (name == "heart") return heart_solution();
    if (name == "mushroom") return mushroom_solution();
    return std::nullopt;
}

std::optional<Puzzle> find_puzzle(const std::string& name) {
    if (name == "tree") return tree_puzzle();
    auto solution = find_solution(name);
    if (!solution) return std::nullopt;
    return Puzzle::from_solution(*solution);
}

} // namespace puzzles
} // namespace nonogram_ga
