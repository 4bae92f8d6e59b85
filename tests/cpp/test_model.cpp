#include <catch2/catch.hpp>
#include "nonogram_ga/error.hpp"
#include "nonogram_ga/puzzle.hpp"
#include "nonogram_ga/puzzles.hpp"
#include "nonogram_ga/segment.hpp"
#include "nonogram_ga/solution.hpp"
#include <stdexcept>

using namespace nonogram_ga;

// ============================================================================
// Segment / run-length encoding tests
// ============================================================================

TEST_CASE("encode_line basic runs", "[segment]") {
    SECTION("empty line") {
        REQUIRE(encode_line({}).empty());
    }

    SECTION("background only") {
        REQUIRE(encode_line({0, 0, 0}).empty());
    }

    SECTION("single run") {
        auto segs = encode_line({0, 1, 1, 0});
        REQUIRE(segs.size() == 1);
        REQUIRE(segs[0] == Segment{1, 2});
    }

    SECTION("adjacent runs of different colors") {
        auto segs = encode_line({1, 1, 2, 1});
        REQUIRE(segs == LineConstraints{{1, 2}, {2, 1}, {1, 1}});
    }

    SECTION("same color separated by background") {
        auto segs = encode_line({1, 0, 1, 0, 0, 1, 1});
        REQUIRE(segs == LineConstraints{{1, 1}, {1, 1}, {1, 2}});
    }
}

TEST_CASE("minimum_width counts mandatory separators", "[segment]") {
    REQUIRE(minimum_width({}) == 0);
    REQUIRE(minimum_width({{1, 3}}) == 3);
    REQUIRE(minimum_width({{1, 2}, {2, 1}, {1, 2}}) == 5);
    REQUIRE(minimum_width({{1, 1}, {1, 1}}) == 3);
    REQUIRE(required_separators({{1, 1}, {1, 1}, {2, 1}, {2, 1}}) == 2);
}

TEST_CASE("LineConstraints to_string", "[segment]") {
    REQUIRE(to_string(LineConstraints{{1, 2}, {2, 1}}) == "1x2 2x1");
    REQUIRE(to_string(LineConstraints{}).empty());
}

// ============================================================================
// Solution tests
// ============================================================================

TEST_CASE("Solution dimensions", "[solution]") {
    SECTION("rectangular grid") {
        Solution s(Grid{{0, 1, 0}, {1, 1, 1}});
        REQUIRE(s.rows() == 2);
        REQUIRE(s.cols() == 3);
        REQUIRE(s.at(1, 2) == 1);
    }

    SECTION("zero rows has no column count") {
        Solution s;
        REQUIRE(s.rows() == 0);
        REQUIRE_THROWS_AS(s.cols(), std::logic_error);
    }

    SECTION("ragged grid is rejected") {
        REQUIRE_THROWS_AS(Solution(Grid{{0, 1}, {1}}), std::invalid_argument);
    }

    SECTION("blank") {
        auto s = Solution::blank(2, 4);
        REQUIRE(s.rows() == 2);
        REQUIRE(s.cols() == 4);
        REQUIRE(s.row_constraints() == Constraints{{}, {}});
    }
}

TEST_CASE("Solution derives the tree constraints", "[solution]") {
    auto solution = puzzles::tree_solution();
    auto puzzle = puzzles::tree_puzzle();

    REQUIRE(solution.row_constraints() == puzzle.row_constraints());
    REQUIRE(solution.col_constraints() == puzzle.col_constraints());
}

TEST_CASE("Solution to_string", "[solution]") {
    Solution s(Grid{{0, 1}, {2, 0}});
    REQUIRE(s.to_string() == "0 1\n2 0\n");
}

// ============================================================================
// Puzzle construction tests
// ============================================================================

TEST_CASE("Puzzle validation", "[puzzle]") {
    SECTION("zero dimensions") {
        REQUIRE_THROWS_AS(Puzzle(0, 1, {}, {{}}), std::invalid_argument);
    }

    SECTION("constraint count mismatch") {
        REQUIRE_THROWS_AS(Puzzle(2, 1, {{}}, {{}}), std::invalid_argument);
        REQUIRE_THROWS_AS(Puzzle(1, 2, {{}}, {{}}), std::invalid_argument);
    }

    SECTION("background colored segment") {
        REQUIRE_THROWS_AS(Puzzle(1, 1, {{{0, 1}}}, {{}}), std::invalid_argument);
    }

    SECTION("zero length segment") {
        REQUIRE_THROWS_AS(Puzzle(1, 1, {{{1, 0}}}, {{}}), std::invalid_argument);
    }

    SECTION("row does not fit") {
        // 同色2セグメントは区切りが必要なので幅3が必要
        REQUIRE_THROWS_AS(Puzzle(1, 2, {{{1, 1}, {1, 1}}}, {{{1, 1}}, {{1, 1}}}),
                          std::invalid_argument);
    }

    SECTION("contradictory but well-formed constraints are accepted") {
        Puzzle p(2, 2, {{{1, 1}}, {}}, {{{1, 1}}, {{1, 1}}});
        REQUIRE(p.rows() == 2);
        REQUIRE(p.cols() == 2);
    }
}

TEST_CASE("Puzzle from_solution", "[puzzle]") {
    Solution s(Grid{{1, 0, 1}, {2, 2, 0}});
    auto p = Puzzle::from_solution(s);

    REQUIRE(p.rows() == 2);
    REQUIRE(p.cols() == 3);
    REQUIRE(p.row_constraints() == Constraints{{{1, 1}, {1, 1}}, {{2, 2}}});
    REQUIRE(p.col_constraints() == Constraints{{{1, 1}, {2, 1}}, {{2, 1}}, {{1, 1}}});
    REQUIRE(p.empty_solution() == Solution::blank(2, 3));
}

// ============================================================================
// Chromosome sampler tests
// ============================================================================

TEST_CASE("new_chromosome_solution satisfies row constraints", "[puzzle][sampler]") {
    for (const auto& name : puzzles::puzzle_names()) {
        auto puzzle = puzzles::find_puzzle(name);
        REQUIRE(puzzle.has_value());

        for (Rng::result_type seed = 0; seed < 50; ++seed) {
            Rng rng(seed);
            auto candidate = puzzle->new_chromosome_solution(rng);
            REQUIRE(candidate.rows() == puzzle->rows());
            REQUIRE(candidate.cols() == puzzle->cols());
            REQUIRE(candidate.row_constraints() == puzzle->row_constraints());
        }
    }
}

TEST_CASE("new_chromosome_solution without slack is exact", "[puzzle][sampler]") {
    Puzzle p = Puzzle::from_solution(Solution(Grid{{1, 0, 1}, {1, 2, 2}}));
    Rng rng(7);
    for (int i = 0; i < 20; ++i) {
        auto candidate = p.new_chromosome_solution(rng);
        REQUIRE(candidate == Solution(Grid{{1, 0, 1}, {1, 2, 2}}));
    }
}

TEST_CASE("new_chromosome_solution with empty row", "[puzzle][sampler]") {
    Puzzle p(2, 3, {{}, {{1, 2}}}, {{}, {{1, 1}}, {{1, 1}}});
    Rng rng(1);
    auto candidate = p.new_chromosome_solution(rng);
    REQUIRE(candidate.row(0) == Line{0, 0, 0});
    REQUIRE(candidate.row_constraints() == p.row_constraints());
}

// ============================================================================
// Fitness scorer tests
// ============================================================================

TEST_CASE("score is zero for the exact solution", "[puzzle][score]") {
    for (const auto& name : puzzles::puzzle_names()) {
        auto puzzle = puzzles::find_puzzle(name);
        auto solution = puzzles::find_solution(name);
        REQUIRE(puzzle.has_value());
        REQUIRE(solution.has_value());
        REQUIRE(puzzle->score(*solution) == 0);
    }
}

TEST_CASE("score penalties", "[puzzle][score]") {
    // 目標: 1列、色1の長さ2
    Puzzle p = Puzzle::from_solution(Solution(Grid{{1}, {1}}));

    SECTION("exact") {
        REQUIRE(p.score(Solution(Grid{{1}, {1}})) == 0);
    }

    SECTION("wrong length costs the length difference") {
        REQUIRE(p.score(Solution(Grid{{1}, {0}})) == 1);
    }

    SECTION("wrong color costs both lengths") {
        REQUIRE(p.score(Solution(Grid{{2}, {2}})) == 4);
    }

    SECTION("missing segment is aligned against a zero placeholder") {
        REQUIRE(p.score(Solution(Grid{{0}, {0}})) == 2);
    }

    SECTION("lists are aligned from the end") {
        // 候補 [1x1, 2x1] vs 目標 [(0x0), 1x2] → 1 + (1 + 2)
        REQUIRE(p.score(Solution(Grid{{1}, {2}})) == 4);
    }
}

TEST_CASE("score rejects mismatched dimensions", "[puzzle][score]") {
    auto puzzle = puzzles::tree_puzzle();
    REQUIRE_THROWS_AS(puzzle.score(Solution::blank(4, 5)), MismatchedDimensions);
    REQUIRE_THROWS_AS(puzzle.score(Solution::blank(5, 6)), MismatchedDimensions);
    REQUIRE_THROWS_AS(puzzle.score(Solution()), MismatchedDimensions);
}

TEST_CASE("score of the blank tree grid", "[puzzle][score]") {
    auto puzzle = puzzles::tree_puzzle();
    // 全列が空 → 目標セグメント長の合計 2 + 3 + (2 + 3) + 3 + 2
    REQUIRE(puzzle.score(puzzle.empty_solution()) == 15);
}
