#include "assist.hh"
#include "helpers.hh"
#include "io.hh"
#include "solver.hh"
#include "sweep.hh"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using steady_clock_t = std::chrono::steady_clock;

// Defaults for starter sweeps.
static constexpr size_t NUM_TEST_TARGETS = 100;
static constexpr uint32_t RANDOM_SEED = 12345;
// Save intermediate results every this many starters.
static constexpr size_t SAVE_INTERVAL = 10;
static constexpr size_t NUM_TOP_STARTERS = 20;

// Used for single games when no starter is given, if it is in the word list.
static constexpr const char* DEFAULT_STARTER = "COURT";

namespace
{
void print_usage(const char* prog)
{
    std::cerr << "usage: " << prog << " sweep words_path [num_targets] [seed] [threads] [max_starters]"
              << std::endl
              << "       " << prog << " solve words_path target [starter]" << std::endl
              << "       " << prog << " assist words_path [starter]" << std::endl;
}

uint64_t parse_number(const char* str, const char* what)
{
    const std::string s(str);
    if (s.empty() || !std::ranges::all_of(s, [] (char chr) { return chr >= '0' && chr <= '9'; }))
        throw std::runtime_error(std::string("Invalid ") + what + ": '" + s + "'");

    try {
        return std::stoull(s);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(std::string("Invalid ") + what + ": '" + s + "'");
    }
}

// The explicitly specified starter, otherwise the default if available.
std::optional<std::string> pick_starter(const opener::solver& solv, int argc, char** argv,
                                        int index)
{
    if (argc > index) {
        const std::string starter = opener::upper_case(argv[index]);
        if (starter.size() != opener::NUM_WORD_LETTERS || !opener::is_upper_alpha(starter))
            throw std::runtime_error("Invalid starter: '" + starter + "'");
        return starter;
    }

    if (std::ranges::find(solv.words(), DEFAULT_STARTER) != solv.words().end())
        return DEFAULT_STARTER;

    return std::nullopt;
}

void save_results(const std::string& path, std::vector<opener::starter_stats> stats)
{
    opener::rank_stats(stats);

    // Losing a snapshot does not invalidate results computed so far.
    try {
        opener::write_results(path, stats);
        std::cout << "Results saved to " << path << " (" << stats.size() << " rows)"
                  << std::endl;
    } catch (const std::runtime_error& err) {
        std::cerr << "error: " << err.what() << std::endl;
    }
}

int run_sweep_mode(const opener::solver& solv, int argc, char** argv)
{
    const size_t num_targets = argc > 3 ? parse_number(argv[3], "target count") : NUM_TEST_TARGETS;
    const uint32_t seed = argc > 4
        ? static_cast<uint32_t>(parse_number(argv[4], "seed"))
        : RANDOM_SEED;
    const unsigned num_threads = argc > 5
        ? static_cast<unsigned>(parse_number(argv[5], "thread count"))
        : 0;
    const size_t max_starters = argc > 6 ? parse_number(argv[6], "starter count") : 0;

    const std::vector<std::string>& words = solv.words();
    const std::vector<std::string> targets = opener::sample_targets(words, num_targets, seed);

    std::vector<std::string> starters = words;
    if (max_starters > 0 && max_starters < starters.size())
        starters.resize(max_starters);

    const std::string intermediate_path =
        opener::results_filename("results_intermediate", targets.size(), seed);
    const std::string final_path = opener::results_filename("results_final", targets.size(), seed);

    std::cout << "Testing " << starters.size() << " starters against " << targets.size()
              << " targets (seed " << seed << "), " << starters.size() * targets.size()
              << " games" << std::endl;

    // Only for periodic snapshots, the returned stats are authoritative.
    std::vector<opener::starter_stats> completed;

    const auto begin = steady_clock_t::now();
    std::vector<opener::starter_stats> stats = opener::run_sweep(
        solv, starters, targets, num_threads,
        [&] (const opener::starter_stats& res, size_t num_completed, size_t total) {
            std::cout << "[" << num_completed << "/" << total << "] " << res.starter
                      << ": solved " << res.solved_games() << "/" << res.total_games()
                      << ", avg " << res.average_tries() << std::endl;

            completed.push_back(res);
            if (num_completed % SAVE_INTERVAL == 0)
                save_results(intermediate_path, completed);
        });
    const auto end = steady_clock_t::now();

    opener::rank_stats(stats);
    save_results(final_path, stats);

    std::cout << std::endl << "--- top " << NUM_TOP_STARTERS << " starters ---" << std::endl;
    opener::print_summary(stats, NUM_TOP_STARTERS);
    if (!stats.empty()) {
        std::cout << std::endl << "--- " << stats.front().starter << " ---" << std::endl;
        opener::print_distribution(stats.front());
    }
    std::cout << "-------------" << std::endl << std::endl;

    const auto time_taken_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count();
    std::cout << "Took " << time_taken_ms << " ms" << std::endl;

    return EXIT_SUCCESS;
}

int run_solve_mode(const opener::solver& solv, int argc, char** argv)
{
    if (argc < 4) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string target = opener::upper_case(argv[3]);
    const std::optional<std::string> starter = pick_starter(solv, argc, argv, 4);

    const opener::game_result res = solv.play(target, starter);
    opener::solver::print_game(res);

    return res.solved() ? EXIT_SUCCESS : EXIT_FAILURE;
}
} // namespace

int main(int argc, char** argv)
{
    if (argc < 3) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string mode = argv[1];
    std::vector<std::string> words;

    try {
        words = opener::read_words(argv[2]);
    } catch (const std::runtime_error& err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        const opener::solver solv(words);

        if (mode == "sweep")
            return run_sweep_mode(solv, argc, argv);

        if (mode == "solve")
            return run_solve_mode(solv, argc, argv);

        if (mode == "assist") {
            opener::run_assist(solv, pick_starter(solv, argc, argv, 3), std::cin);
            return EXIT_SUCCESS;
        }

        print_usage(argv[0]);
        return EXIT_FAILURE;
    } catch (const std::runtime_error& err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
