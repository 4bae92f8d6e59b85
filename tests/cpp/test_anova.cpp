#include <catch2/catch.hpp>
#include "nonogram_ga/anova.hpp"
#include "nonogram_ga/puzzles.hpp"
#include <stdexcept>

using namespace nonogram_ga;

namespace {

AnovaGrid small_grid() {
    AnovaGrid grid;
    grid.cross_probabilities = {0.6};
    grid.mutation_probabilities = {0.1, 0.3};
    grid.slide_tries = {3};
    grid.seeds = {23};
    return grid;
}

}  // namespace

// ============================================================================
// Parameter sweep tests
// ============================================================================

TEST_CASE("AnovaGrid defaults", "[anova]") {
    AnovaGrid grid;
    REQUIRE(grid.combinations() == 270);
    REQUIRE(grid.population_size == 500);
    REQUIRE(grid.tournament_size == 3);
    REQUIRE(grid.max_iterations == 300);
    REQUIRE(grid.seeds.front() == 11);
    REQUIRE(grid.seeds.back() == 43);
}

TEST_CASE("anova finds a winning combination for the tree puzzle", "[anova]") {
    auto puzzle = puzzles::tree_puzzle();
    EvolutiveSolver solver;

    auto result = anova(puzzle, small_grid(), solver);

    REQUIRE(result.trials.size() == 2);
    REQUIRE(result.best.has_value());
    REQUIRE(result.solved());
    REQUIRE(result.best->best_score == 0);
    REQUIRE(result.best->status == SearchStatus::Won);
    REQUIRE(result.best->seed == 23);
    REQUIRE(result.best->params.population_size == 500);
    REQUIRE(result.best->params.cross_probability == 0.6);

    // 最初の試行は既定パラメータでの探索と同一
    REQUIRE(result.trials.front().params.mutation_probability == 0.1);
    REQUIRE(result.trials.front().best_score == 0);
}

TEST_CASE("anova records every trial in grid order", "[anova]") {
    auto puzzle = puzzles::find_puzzle("heart").value();
    AnovaGrid grid;
    grid.cross_probabilities = {0.3, 0.9};
    grid.mutation_probabilities = {0.2};
    grid.slide_tries = {3, 5};
    grid.seeds = {11, 13};
    grid.population_size = 10;
    grid.max_iterations = 5;

    EvolutiveSolver solver;
    auto result = anova(puzzle, grid, solver);

    REQUIRE(result.trials.size() == grid.combinations());
    REQUIRE(result.trials[0].params.cross_probability == 0.3);
    REQUIRE(result.trials[0].params.slide_tries == 3);
    REQUIRE(result.trials[0].seed == 11);
    REQUIRE(result.trials[1].seed == 13);
    REQUIRE(result.trials[2].params.slide_tries == 5);
    REQUIRE(result.trials[7].params.cross_probability == 0.9);

    REQUIRE(result.best.has_value());
    for (const auto& trial : result.trials) {
        REQUIRE(trial.iterations <= 5);
        REQUIRE(result.best->best_score <= trial.best_score);
    }
}

TEST_CASE("anova on an unsolvable puzzle", "[anova]") {
    Puzzle contradictory(2, 2, {{{1, 1}}, {}}, {{{1, 1}}, {{1, 1}}});
    AnovaGrid grid = small_grid();
    grid.population_size = 8;
    grid.max_iterations = 6;

    EvolutiveSolver solver;
    auto result = anova(contradictory, grid, solver);

    REQUIRE(result.trials.size() == 2);
    REQUIRE(result.best.has_value());
    REQUIRE(result.best->best_score > 0);
    REQUIRE_FALSE(result.solved());
}

TEST_CASE("anova with a stopped solver", "[anova]") {
    EvolutiveSolver solver;
    solver.stop();

    auto result = anova(puzzles::tree_puzzle(), small_grid(), solver);
    REQUIRE(result.trials.empty());
    REQUIRE_FALSE(result.best.has_value());
    REQUIRE_FALSE(result.solved());
}

TEST_CASE("anova rejects an invalid grid", "[anova]") {
    AnovaGrid grid = small_grid();
    grid.population_size = 0;

    EvolutiveSolver solver;
    REQUIRE_THROWS_AS(anova(puzzles::tree_puzzle(), grid, solver), std::invalid_argument);
}

// ============================================================================
// Puzzle catalog tests
// ============================================================================

TEST_CASE("puzzle catalog", "[puzzles]") {
    const auto& names = puzzles::puzzle_names();
    REQUIRE(names.size() == 3);
    REQUIRE(names.front() == "tree");

    for (const auto& name : names) {
        auto puzzle = puzzles::find_puzzle(name);
        auto solution = puzzles::find_solution(name);
        REQUIRE(puzzle.has_value());
        REQUIRE(solution.has_value());
        REQUIRE(solution->rows() == puzzle->rows());
        REQUIRE(solution->cols() == puzzle->cols());
        REQUIRE(puzzle->score(*solution) == 0);
    }

    REQUIRE_FALSE(puzzles::find_puzzle("dragon").has_value());
    REQUIRE_FALSE(puzzles::find_solution("dragon").has_value());
}

TEST_CASE("tree puzzle colors", "[puzzles]") {
    auto solution = puzzles::tree_solution();
    REQUIRE(solution.at(0, 0) == BACKGROUND);
    REQUIRE(solution.at(1, 0) == puzzles::LEAVES);
    REQUIRE(solution.at(4, 2) == puzzles::WOOD);
}
