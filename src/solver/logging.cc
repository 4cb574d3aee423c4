#include "solver.hh"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace
{
const char* status_string(opener::game_status status)
{
    switch (status) {
    case opener::game_status::solved:
        return "solved";
    case opener::game_status::exhausted:
        return "failed (out of turns)";
    case opener::game_status::contradiction:
        return "failed (no candidates left, is the target in the word list?)";
    }

    return "unknown";
}
} // namespace

namespace opener
{
void solver::print_game(const game_result& res)
{
    int turn = 1;
    for (const turn_record& rec : res.history) {
        std::cout << turn++ << ": " << rec.guess << " " << rec.fb.to_string()
                  << " " << rec.remaining << std::endl;
    }

    std::cout << res.target << ": " << status_string(res.status);
    if (const auto solved_turn = res.solved_turn())
        std::cout << " in " << *solved_turn;
    std::cout << std::endl;
}

void solver::print_ranking(const std::vector<scored_guess>& ranked, size_t count)
{
    const size_t num = std::min(count, ranked.size());

    for (size_t i = 0; i < num; i++) {
        const scored_guess& guess = ranked[i];

        std::cout << "  " << guess.word
                  << ": max=" << guess.stats.max_bucket
                  << ", avg=" << std::fixed << std::setprecision(1) << guess.stats.avg_bucket
                  << ", new=" << guess.new_letters
                  << ", known=" << guess.known_letters
                  << ", score=" << std::setprecision(3) << guess.score
                  << std::defaultfloat
                  << (guess.stats.is_candidate_answer ? " [answer]" : " [eliminate]")
                  << std::endl;
    }
}
} // namespace opener
