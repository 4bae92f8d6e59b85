#include "nonogram_ga/evolutive.hpp"
#include "nonogram_ga/genetic.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace nonogram_ga {

// ============================================================================
// SearchParams
// ============================================================================

void SearchParams::validate() const {
    if (population_size == 0) {
        throw std::invalid_argument("population_size must be positive");
    }
    if (tournament_size == 0) {
        throw std::invalid_argument("tournament_size must be positive");
    }
    if (!(cross_probability >= 0.0 && cross_probability <= 1.0)) {
        throw std::invalid_argument("cross_probability must be in [0, 1], got "
                                    + std::to_string(cross_probability));
    }
    if (!(mutation_probability >= 0.0 && mutation_probability <= 1.0)) {
        throw std::invalid_argument("mutation_probability must be in [0, 1], got "
                                    + std::to_string(mutation_probability));
    }
}

// ============================================================================
// History
// ============================================================================

void History::push(const Population& population) {
    ++iterations;
    best.push_back(population.front().score);
    median.push_back(get_median(population));
    worst.push_back(population.back().score);
}

double History::get_median(const Population& population) {
    size_t n = population.size();
    if (n % 2 == 0) {
        return static_cast<double>(population[n / 2 - 1].score + population[n / 2].score) / 2.0;
    }
    return static_cast<double>(population[n / 2].score);
}

const char* to_string(SearchStatus status) {
    switch (status) {
        case SearchStatus::Running: return "running";
        case SearchStatus::Won: return "won";
        case SearchStatus::Exhausted: return "exhausted";
        case SearchStatus::Stopped: return "stopped";
    }
    return "unknown";
}

// ============================================================================
// Selection & replacement
// ============================================================================

const Solution& tournament_selection(const Population& population,
                                     size_t tournament_size,
                                     Rng& rng) {
    if (population.empty()) {
        throw std::invalid_argument("The tournament population is empty");
    }
    if (tournament_size == 0) {
        throw std::invalid_argument("The tournament is empty");
    }

    size_t n = population.size();
    size_t k = std::min(tournament_size, n);

    // Floyd の方法で重複なしに k 個のインデックスを抽出
    std::vector<size_t> chosen;
    chosen.reserve(k);
    for (size_t j = n - k; j < n; ++j) {
        size_t t = gen_range(rng, 0, j);
        if (std::find(chosen.begin(), chosen.end(), t) == chosen.end()) {
            chosen.push_back(t);
        } else {
            chosen.push_back(j);
        }
    }

    size_t winner = chosen.front();
    for (size_t idx : chosen) {
        if (population[idx].score < population[winner].score) {
            winner = idx;
        }
    }
    return population[winner].solution;
}

Population preserve_elite_population(const Puzzle& puzzle,
                                     Population population,
                                     std::vector<Solution> offspring) {
    size_t population_size = population.size();
    population.reserve(population_size + offspring.size());
    for (auto& descendant : offspring) {
        size_t score = puzzle.score(descendant);
        population.push_back(ScoredSolution{std::move(descendant), score});
    }
    std::stable_sort(population.begin(), population.end(),
                     [](const ScoredSolution& a, const ScoredSolution& b) {
                         return a.score < b.score;
                     });
    population.erase(population.begin() + static_cast<std::ptrdiff_t>(population_size),
                     population.end());
    return population;
}

// ============================================================================
// EvolutiveSolver
// ============================================================================

EvolutiveSolver::EvolutiveSolver(SearchParams params) {
    set_params(std::move(params));
}

void EvolutiveSolver::set_params(SearchParams params) {
    params.validate();
    params_ = params;
}

History EvolutiveSolver::solve(const Puzzle& puzzle, Rng& rng) {
    params_.validate();
    stats_ = SearchStats{};

    if (verbose_) {
        std::cerr << "% [verbose] evolutive search start: " << puzzle.rows() << "x" << puzzle.cols()
                  << " population=" << params_.population_size
                  << " cross=" << params_.cross_probability
                  << " mutation=" << params_.mutation_probability
                  << " tournament=" << params_.tournament_size
                  << " slides=" << params_.slide_tries
                  << " max_iterations=" << params_.max_iterations << "\n";
    }

    History history;
    Population population = initial_population(puzzle, rng);

    while (history.iterations < params_.max_iterations) {
        if (stopped_) {
            history.status = SearchStatus::Stopped;
            break;
        }

        size_t previous_best = history.best.empty() ? SIZE_MAX : history.best.back();
        history.push(population);
        ++stats_.generations;

        if (verbose_ && population.front().score < previous_best) {
            std::cerr << "% [verbose] generation " << history.iterations
                      << ": best=" << history.best.back()
                      << " median=" << history.median.back()
                      << " worst=" << history.worst.back() << "\n";
        }

        if (population.front().score == 0) {
            history.status = SearchStatus::Won;
            break;
        }

        auto offspring = recombinate_population(puzzle, population, rng);
        mutate_population(puzzle, offspring, rng);
        stats_.evaluations += offspring.size();
        population = preserve_elite_population(puzzle, std::move(population), std::move(offspring));
    }

    if (history.status == SearchStatus::Running) {
        history.status = SearchStatus::Exhausted;
    }
    history.solution = population.front().solution;

    if (verbose_) {
        std::cerr << "% [verbose] evolutive search " << to_string(history.status)
                  << " after " << history.iterations << " generations, best score "
                  << population.front().score << "\n";
    }
    return history;
}

Population EvolutiveSolver::initial_population(const Puzzle& puzzle, Rng& rng) {
    Population population;
    population.reserve(params_.population_size);
    for (size_t i = 0; i < params_.population_size; ++i) {
        Solution solution = puzzle.new_chromosome_solution(rng);
        size_t score = puzzle.score(solution);
        population.push_back(ScoredSolution{std::move(solution), score});
    }
    stats_.evaluations += population.size();

    std::stable_sort(population.begin(), population.end(),
                     [](const ScoredSolution& a, const ScoredSolution& b) {
                         return a.score < b.score;
                     });
    return population;
}

std::vector<Solution> EvolutiveSolver::recombinate_population(const Puzzle& puzzle,
                                                              const Population& population,
                                                              Rng& rng) {
    std::vector<Solution> offspring;
    offspring.reserve(population.size() + 1);

    while (offspring.size() < population.size()) {
        const Solution& ancestor_1 = tournament_selection(population, params_.tournament_size, rng);
        const Solution& ancestor_2 = tournament_selection(population, params_.tournament_size, rng);

        Descendants descendants;
        if (gen_bool(rng, 0.5)) {
            descendants = uniform_cross(puzzle, ancestor_1, ancestor_2,
                                        params_.cross_probability, rng);
            ++stats_.uniform_crosses;
        } else {
            descendants = two_point_cross(puzzle, ancestor_1, ancestor_2,
                                          params_.cross_probability, rng);
            ++stats_.two_point_crosses;
        }
        offspring.push_back(std::move(descendants.first));
        offspring.push_back(std::move(descendants.second));
    }
    return offspring;
}

void EvolutiveSolver::mutate_population(const Puzzle& puzzle,
                                        std::vector<Solution>& offspring,
                                        Rng& rng) {
    for (auto& descendant : offspring) {
        stats_.slides += chromosome_mutation(puzzle, descendant,
                                             params_.mutation_probability,
                                             params_.slide_tries, rng);
    }
}

// ============================================================================
// Entry points
// ============================================================================

History evolutive_search(size_t population_size,
                         const Puzzle& puzzle,
                         double cross_probability,
                         double mutation_probability,
                         size_t tournament_size,
                         size_t slide_tries,
                         size_t max_iterations,
                         Rng& rng) {
    SearchParams params;
    params.population_size = population_size;
    params.cross_probability = cross_probability;
    params.mutation_probability = mutation_probability;
    params.tournament_size = tournament_size;
    params.slide_tries = slide_tries;
    params.max_iterations = max_iterations;

    EvolutiveSolver solver(params);
    return solver.solve(puzzle, rng);
}

History solve_nonogram(const Puzzle& puzzle) {
    Rng rng(DEFAULT_SEED);
    EvolutiveSolver solver;
    return solver.solve(puzzle, rng);
}

} // namespace nonogram_ga
