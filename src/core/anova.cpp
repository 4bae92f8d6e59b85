#include "nonogram_ga/anova.hpp"
#include <iostream>

namespace nonogram_ga {

AnovaResult anova(const Puzzle& puzzle, const AnovaGrid& grid, EvolutiveSolver& solver) {
    AnovaResult result;
    result.trials.reserve(grid.combinations());

    for (double cross_probability : grid.cross_probabilities) {
        for (double mutation_probability : grid.mutation_probabilities) {
            for (size_t slide_tries : grid.slide_tries) {
                for (auto seed : grid.seeds) {
                    if (solver.is_stopped()) {
                        return result;
                    }

                    SearchParams params;
                    params.population_size = grid.population_size;
                    params.cross_probability = cross_probability;
                    params.mutation_probability = mutation_probability;
                    params.tournament_size = grid.tournament_size;
                    params.slide_tries = slide_tries;
                    params.max_iterations = grid.max_iterations;
                    solver.set_params(params);

                    if (solver.is_verbose()) {
                        std::cerr << "% [verbose] anova: cross=" << cross_probability
                                  << " mutation=" << mutation_probability
                                  << " slides=" << slide_tries
                                  << " seed=" << seed << "\n";
                    }

                    Rng rng(seed);
                    History history = solver.solve(puzzle, rng);
                    if (history.best.empty()) {
                        // max_iterations == 0 または停止済み
                        continue;
                    }

                    AnovaTrial trial{params, seed, history.best.back(),
                                     history.iterations, history.status};
                    if (solver.is_verbose()) {
                        std::cerr << "% [verbose] anova: score=" << trial.best_score
                                  << " iterations=" << trial.iterations << "\n";
                    }

                    if (!result.best || trial.best_score < result.best->best_score) {
                        result.best = trial;
                    }
                    result.trials.push_back(trial);
                }
            }
        }
    }
    return result;
}

AnovaResult anova(const Puzzle& puzzle) {
    EvolutiveSolver solver;
    return anova(puzzle, AnovaGrid{}, solver);
}

} // namespace nonogram_ga
