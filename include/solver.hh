#pragma once

#include "feedback.hh"
#include "helpers.hh"
#include "knowledge.hh"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_set>
#include <vector>

namespace opener
{
static constexpr int NUM_ALLOWED_GUESSES = 6;

// Tunable thresholds of the guess selector. Each regime is selected purely on
// the number of remaining candidates, and every "first N" scan looks at the
// leading N words of the full list in its given order (skipping candidates),
// so results depend on dictionary ordering.
struct selector_config
{
    // More candidates than this: elimination regime.
    size_t elimination_threshold = 15;
    // More candidates than this (but not elimination): exploration regime.
    // At or below: answer-focused regime.
    size_t exploration_threshold = 6;

    // Answers get the commit bonus with this many candidates or fewer...
    size_t endgame_size = 2;
    // ...or from this turn onward.
    int late_turn = 5;

    // Leading words of the list scanned for a guess telling two candidates
    // apart.
    size_t pair_scan_limit = 200;

    // As above, for the elimination and exploration sets.
    size_t elimination_scan_limit = 800;
    int elimination_min_new_letters = 3;
    // If fewer words test enough new letters, fall back to letter frequency.
    size_t elimination_min_pool = 50;
    size_t elimination_cap = 150;

    size_t exploration_scan_limit = 600;
    int exploration_min_new_letters = 2;
    size_t exploration_cap = 100;

    // Answer-focused sets smaller than this are extended with leading words
    // of the list, considering at most `answer_extend_limit` of them.
    size_t answer_min_pool = 50;
    size_t answer_extend_limit = 100;

    // Score adjustments, see solver::score_guess().
    double new_letter_weight = 0.5;
    double known_letter_weight = 0.3;
    double commit_bonus = 1.0;
    double early_answer_penalty = 2.0;
    double elimination_bonus = 0.5;

    // At most NUM_ALLOWED_GUESSES.
    int max_turns = NUM_ALLOWED_GUESSES;
};

// The strategy a selection is made under.
enum class regime
{
    forced,
    starter,
    pair,
    elimination,
    exploration,
    answer,
};

const char* regime_name(regime r);

// Metrics of the partition a guess induces on the candidates.
struct partition_stats
{
    // Size of the largest bucket, i.e. worst case remaining after the guess.
    int max_bucket = 0;
    // Mean bucket size.
    double avg_bucket = 0;
    // Is the guess itself one of the candidates?
    bool is_candidate_answer = false;
    double elimination_score = 0;
};

// A word from an evaluation set with its metrics and final score, the lower
// the better.
struct scored_guess
{
    std::string word;
    partition_stats stats;
    int new_letters = 0;
    int known_letters = 0;
    double score = 0;

    // Lowest score wins, ties go to the smallest worst case, then average,
    // then alphabetical order.
    std::tuple<double, int, double, const std::string&> rank_key() const
    {
        return { score, stats.max_bucket, stats.avg_bucket, word };
    }
};

enum class game_status
{
    solved,
    // Ran out of turns.
    exhausted,
    // The candidate set became empty, the target cannot be in the word list.
    contradiction,
};

struct turn_record
{
    std::string guess;
    feedback fb;
    // Candidates left after this turn.
    size_t remaining = 0;
};

struct game_result
{
    std::optional<std::string> starter;
    std::string target;
    std::vector<turn_record> history;
    game_status status = game_status::exhausted;

    bool solved() const
    {
        return status == game_status::solved;
    }

    // Turn the game was solved on, if it was.
    std::optional<int> solved_turn() const
    {
        if (!solved())
            return std::nullopt;
        return static_cast<int>(history.size());
    }

    std::vector<std::string> guesses() const;
};

// Plays games against a fixed, ordered word list. The word list and config are
// never modified after construction so a single solver may be shared between
// threads.
class solver final
{
public:
    solver(const std::vector<std::string>& words, const selector_config& config = {});

    const std::vector<std::string>& words() const
    {
        return m_words;
    }

    const selector_config& config() const
    {
        return m_config;
    }

    // The heuristic regime applying to a candidate set of the given size.
    regime classify(size_t num_candidates) const;

    // The regime select_guess() will use, in order of precedence: a single
    // candidate, the starter on turn 1, two candidates, then by size.
    regime regime_for(size_t num_candidates, int turn, bool has_starter) const;

    // Group candidates by the feedback `guess` would produce against each.
    static partition_t partition(const std::string& guess,
                                 const std::vector<std::string>& candidates);

    static partition_stats evaluate(const std::string& guess,
                                    const std::vector<std::string>& candidates);

    // The words the heuristic regimes score, in discovery order.
    std::vector<std::string> evaluation_set(const std::vector<std::string>& candidates,
                                            const knowledge& state) const;

    scored_guess score_guess(const std::string& word, const partition_stats& stats,
                             size_t num_candidates, int turn,
                             const knowledge& state) const;

    // Score the evaluation set, best first.
    std::vector<scored_guess> rank_guesses(const std::vector<std::string>& candidates,
                                           int turn, const knowledge& state) const;

    // Choose the next guess. If `starter` is specified it is used on turn 1
    // regardless of heuristics.
    std::string select_guess(const std::vector<std::string>& candidates, int turn,
                             const knowledge& state,
                             const std::optional<std::string>& starter = std::nullopt) const;

    // Play a full game against `target`.
    game_result play(const std::string& target,
                     const std::optional<std::string>& starter = std::nullopt) const;

    // Print each turn of a game to standard out.
    static void print_game(const game_result& res);

    // Print the best `count` scored guesses to standard out.
    static void print_ranking(const std::vector<scored_guess>& ranked, size_t count);

private:
    using word_set = std::unordered_set<std::string>;

    const std::vector<std::string> m_words;
    const selector_config m_config;

    // Invoke `func` on each of the first `limit` words of the list which is
    // not a candidate. Candidates inside the window are skipped, not replaced.
    template<typename TFunc>
    void for_each_non_candidate(const word_set& candidates, size_t limit,
                                TFunc&& func) const
    {
        const size_t end = std::min(limit, m_words.size());
        for (size_t i = 0; i < end; i++) {
            if (!candidates.contains(m_words[i]))
                func(m_words[i]);
        }
    }

    // Score every word of the evaluation set, in evaluation set order.
    std::vector<scored_guess> score_evaluation_set(const std::vector<std::string>& candidates,
                                                   int turn, const knowledge& state) const;

    // Find a word which produces different feedback for the two candidates.
    std::string select_pair_splitter(const std::vector<std::string>& candidates) const;

    std::vector<std::string> elimination_set(const std::vector<std::string>& candidates,
                                             const knowledge& state) const;
    std::vector<std::string> exploration_set(const std::vector<std::string>& candidates,
                                             const knowledge& state) const;
    std::vector<std::string> answer_set(const std::vector<std::string>& candidates) const;

    // Check a word is of the correct length and consists of letters A-Z.
    static void check_word(const std::string& word, const char* what);

    // Check the word list is non-empty and all words are valid.
    static void check_words(const std::vector<std::string>& words);

    static void check_config(const selector_config& config);
}; // class solver
} // namespace opener
