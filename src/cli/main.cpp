#include "nonogram_ga/anova.hpp"
#include "nonogram_ga/evolutive.hpp"
#include "nonogram_ga/puzzles.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
nonogram_ga::EvolutiveSolver* g_current_solver = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [PUZZLE]\n";
    std::cerr << "  -n POP     Population size (default 500)\n";
    std::cerr << "  -c PROB    Cross probability (default 0.6)\n";
    std::cerr << "  -m PROB    Mutation probability (default 0.1)\n";
    std::cerr << "  -k SIZE    Tournament size (default 3)\n";
    std::cerr << "  -w TRIES   Slide tries per row (default 3)\n";
    std::cerr << "  -i ITER    Maximum iterations (default 300)\n";
    std::cerr << "  -r SEED    Random seed (default 23)\n";
    std::cerr << "  -a         Run the parameter sweep instead of a single search\n";
    std::cerr << "  -H         Print best/median/worst scores per generation as CSV\n";
    std::cerr << "  -s         Print search statistics to stderr\n";
    std::cerr << "  -v         Verbose mode (print search progress)\n";
    std::cerr << "  -t SEC     Timeout in seconds\n";
    std::cerr << "  -l         List built-in puzzles\n";
}

bool g_print_stats = false;
bool g_print_history = false;

void print_stats(const nonogram_ga::EvolutiveSolver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: generations=" << s.generations
              << " evaluations=" << s.evaluations
              << " uniform_crosses=" << s.uniform_crosses
              << " two_point_crosses=" << s.two_point_crosses
              << " slides=" << s.slides
              << "\n";
}

void print_history(const nonogram_ga::History& history) {
    std::cout << "iteration,best,median,worst\n";
    for (size_t i = 0; i < history.iterations; ++i) {
        std::cout << i << "," << history.best[i] << "," << history.median[i]
                  << "," << history.worst[i] << "\n";
    }
}

/**
 * @brief パズルを1回解く
 */
void run_search(const nonogram_ga::Puzzle& puzzle, nonogram_ga::EvolutiveSolver& solver,
                nonogram_ga::Rng::result_type seed) {
    nonogram_ga::Rng rng(seed);
    auto history = solver.solve(puzzle, rng);
    print_stats(solver);
    if (g_timeout_flag) {
        std::cerr << "% timeout after " << history.iterations << " generations\n";
    }

    if (g_print_history) {
        print_history(history);
    }

    std::cout << history.solution.to_string();
    if (history.solved()) {
        std::cout << "==========\n";
    } else {
        std::cout << "% best score: " << puzzle.score(history.solution) << "\n";
        std::cout << "=====UNKNOWN=====\n";
    }
}

/**
 * @brief パラメータの格子探索を実行
 */
void run_anova(const nonogram_ga::Puzzle& puzzle, nonogram_ga::EvolutiveSolver& solver) {
    auto result = nonogram_ga::anova(puzzle, nonogram_ga::AnovaGrid{}, solver);

    std::cout << "% trials: " << result.trials.size() << "\n";
    if (!result.best) {
        std::cout << "% A valid combination wasn't found\n";
        return;
    }
    const auto& best = *result.best;
    std::cout << "% best score: " << best.best_score
              << " population=" << best.params.population_size
              << " cross=" << best.params.cross_probability
              << " mutation=" << best.params.mutation_probability
              << " tournament=" << best.params.tournament_size
              << " slides=" << best.params.slide_tries
              << " max_iterations=" << best.params.max_iterations
              << " seed=" << best.seed << "\n";
    if (!result.solved()) {
        std::cout << "% no combination reached a score of 0\n";
    }
}

int main(int argc, char* argv[]) {
    nonogram_ga::SearchParams params;
    nonogram_ga::Rng::result_type seed = nonogram_ga::DEFAULT_SEED;
    std::string puzzle_name = "tree";
    bool sweep = false;
    bool verbose = false;
    int timeout_sec = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            params.population_size = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            params.cross_probability = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            params.mutation_probability = std::atof(argv[++i]);
        } else if (std::strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
            params.tournament_size = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "-w") == 0 && i + 1 < argc) {
            params.slide_tries = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            params.max_iterations = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            seed = static_cast<nonogram_ga::Rng::result_type>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "-a") == 0) {
            sweep = true;
        } else if (std::strcmp(argv[i], "-H") == 0) {
            g_print_history = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-l") == 0) {
            for (const auto& name : nonogram_ga::puzzles::puzzle_names()) {
                std::cout << name << "\n";
            }
            return 0;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            puzzle_name = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    auto puzzle = nonogram_ga::puzzles::find_puzzle(puzzle_name);
    if (!puzzle) {
        std::cerr << "Unknown puzzle: " << puzzle_name << "\n";
        return 1;
    }

    try {
        nonogram_ga::EvolutiveSolver solver(params);
        solver.set_verbose(verbose);
        g_current_solver = &solver;

        // Setup timeout
        if (timeout_sec > 0) {
            std::signal(SIGALRM, timeout_handler);
            alarm(timeout_sec);
        }

        if (sweep) {
            run_anova(*puzzle, solver);
        } else {
            run_search(*puzzle, solver, seed);
        }
        g_current_solver = nullptr;
    } catch (const std::exception& e) {
        g_current_solver = nullptr;
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
