#pragma once

#include "solver.hh"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace opener
{
// Aggregated outcomes of every game played with one starter.
struct starter_stats
{
    std::string starter;
    // Games solved on each turn, tries[0] is turn 1.
    std::array<int, NUM_ALLOWED_GUESSES> tries = {};
    int failed = 0;

    void record(const game_result& res);

    int total_games() const;
    int solved_games() const;

    // Percentage of games solved.
    double success_rate() const;

    // Mean turns over solved games, 0 if none were.
    double average_tries() const;
};

// Invoked once per completed starter. Calls are serialised.
using progress_fn = std::function<void(const starter_stats& stats, size_t completed,
                                       size_t total)>;

// Draw `count` distinct targets from `words`, reproducibly for a given seed.
// If `count` exceeds the number of words all words are used.
std::vector<std::string> sample_targets(const std::vector<std::string>& words,
                                        size_t count, uint32_t seed);

// Play every target with every starter, spreading starters over
// `num_threads` worker threads (0 for one per online core). Returns stats in
// starter order.
std::vector<starter_stats> run_sweep(const solver& solv,
                                     const std::vector<std::string>& starters,
                                     const std::vector<std::string>& targets,
                                     unsigned num_threads,
                                     const progress_fn& on_complete = {});

// Sort best first: highest success rate, then fewest average tries.
void rank_stats(std::vector<starter_stats>& stats);

// e.g. results_targets100_seed12345_2024-01-31_12-00-00.csv
std::string results_filename(const std::string& prefix, size_t num_targets, uint32_t seed);

// Write stats as CSV, in the order given.
void write_results(const std::string& path, const std::vector<starter_stats>& stats);

// Print the first `count` stats as a ranked table to standard out.
void print_summary(const std::vector<starter_stats>& stats, size_t count);

// Print the guess distribution of one starter to standard out.
void print_distribution(const starter_stats& stats);
} // namespace opener
