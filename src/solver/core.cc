#include "helpers.hh"
#include "solver.hh"

#include <algorithm>
#include <array>
#include <functional>
#include <optional>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_set>
#include <utility>
#include <vector>

namespace
{
constexpr int NUM_LETTERS = 26;

using letter_freq_t = std::array<int, NUM_LETTERS>;

// Count, for each letter, how many candidates contain it (each letter counted
// once per word).
letter_freq_t get_letter_frequencies(const std::vector<std::string>& candidates)
{
    letter_freq_t ret = {};

    for (const std::string& candidate : candidates) {
        for (const char letter : opener::distinct_letters(candidate)) {
            ret[letter - 'A']++;
        }
    }

    return ret;
}

int score_word_frequency(const std::string& word, const letter_freq_t& freq)
{
    int ret = 0;
    for (const char letter : opener::distinct_letters(word)) {
        ret += freq[letter - 'A'];
    }
    return ret;
}
} // namespace

namespace opener
{
const char* regime_name(regime r)
{
    switch (r) {
    case regime::forced:
        return "forced";
    case regime::starter:
        return "starter";
    case regime::pair:
        return "pair";
    case regime::elimination:
        return "elimination";
    case regime::exploration:
        return "exploration";
    case regime::answer:
        return "answer";
    }

    return "unknown";
}

std::vector<std::string> game_result::guesses() const
{
    std::vector<std::string> ret;
    ret.reserve(history.size());

    for (const turn_record& rec : history) {
        ret.push_back(rec.guess);
    }

    return ret;
}

solver::solver(const std::vector<std::string>& words, const selector_config& config)
    : m_words{words}
    , m_config{config}
{
    check_words(m_words);
    check_config(m_config);
}

regime solver::classify(size_t num_candidates) const
{
    if (num_candidates > m_config.elimination_threshold)
        return regime::elimination;
    if (num_candidates > m_config.exploration_threshold)
        return regime::exploration;
    return regime::answer;
}

regime solver::regime_for(size_t num_candidates, int turn, bool has_starter) const
{
    if (num_candidates == 1)
        return regime::forced;
    if (turn == 1 && has_starter)
        return regime::starter;
    if (num_candidates == 2)
        return regime::pair;
    return classify(num_candidates);
}

partition_t solver::partition(const std::string& guess,
                              const std::vector<std::string>& candidates)
{
    partition_t ret;

    for (const std::string& candidate : candidates) {
        ret[compute_feedback(guess, candidate)].push_back(candidate);
    }

    return ret;
}

partition_stats solver::evaluate(const std::string& guess,
                                 const std::vector<std::string>& candidates)
{
    partition_stats ret;
    if (candidates.empty())
        return ret;

    const partition_t buckets = partition(guess, candidates);

    for (const auto& [ fb, words ] : buckets) {
        ret.max_bucket = std::max(ret.max_bucket, static_cast<int>(words.size()));
    }

    const double num_candidates = static_cast<double>(candidates.size());
    ret.avg_bucket = num_candidates / buckets.size();
    // Only the guess itself can produce an all-correct match.
    ret.is_candidate_answer = buckets.contains(feedback::all_correct());
    ret.elimination_score = num_candidates - ret.avg_bucket;

    return ret;
}

std::vector<std::string> solver::evaluation_set(const std::vector<std::string>& candidates,
                                                const knowledge& state) const
{
    switch (classify(candidates.size())) {
    case regime::elimination:
        return elimination_set(candidates, state);
    case regime::exploration:
        return exploration_set(candidates, state);
    default:
        return answer_set(candidates);
    }
}

std::vector<std::string> solver::elimination_set(const std::vector<std::string>& candidates,
                                                 const knowledge& state) const
{
    const word_set lookup(candidates.begin(), candidates.end());

    // We keep the scanned words around in case we need to fall back.
    std::vector<std::string> scanned;
    std::vector<std::string> ret;

    for_each_non_candidate(lookup, m_config.elimination_scan_limit, [&] (const std::string& word) {
        scanned.push_back(word);

        if (state.count_new_letters(word) >= m_config.elimination_min_new_letters)
            ret.push_back(word);
    });

    // Too few words test enough new letters, instead take anything that tests
    // a letter at least one candidate contains.
    if (ret.size() < m_config.elimination_min_pool) {
        const letter_freq_t freq = get_letter_frequencies(candidates);

        ret.clear();
        for (const std::string& word : scanned) {
            if (score_word_frequency(word, freq) > 0)
                ret.push_back(word);
        }
    }

    if (ret.size() > m_config.elimination_cap)
        ret.resize(m_config.elimination_cap);

    return ret;
}

std::vector<std::string> solver::exploration_set(const std::vector<std::string>& candidates,
                                                 const knowledge& state) const
{
    const word_set lookup(candidates.begin(), candidates.end());

    std::vector<std::pair<int, std::string>> ranked;

    for_each_non_candidate(lookup, m_config.exploration_scan_limit, [&] (const std::string& word) {
        const int new_letters = state.count_new_letters(word);

        if (new_letters >= m_config.exploration_min_new_letters)
            ranked.emplace_back(new_letters, word);
    });

    // Most new letters first, otherwise in list order.
    std::ranges::stable_sort(ranked, std::ranges::greater{},
                             &std::pair<int, std::string>::first);

    if (ranked.size() > m_config.exploration_cap)
        ranked.resize(m_config.exploration_cap);

    std::vector<std::string> ret;
    ret.reserve(ranked.size());
    for (auto& [ new_letters, word ] : ranked) {
        ret.push_back(std::move(word));
    }

    return ret;
}

std::vector<std::string> solver::answer_set(const std::vector<std::string>& candidates) const
{
    std::vector<std::string> ret = candidates;

    if (ret.size() >= m_config.answer_min_pool)
        return ret;

    word_set included(ret.begin(), ret.end());

    const size_t limit = std::min(m_config.answer_extend_limit, m_words.size());
    for (size_t i = 0; i < limit; i++) {
        const std::string& word = m_words[i];

        if (!included.contains(word)) {
            ret.push_back(word);
            included.insert(word);
        }
    }

    return ret;
}

scored_guess solver::score_guess(const std::string& word, const partition_stats& stats,
                                 size_t num_candidates, int turn,
                                 const knowledge& state) const
{
    scored_guess ret;
    ret.word = word;
    ret.stats = stats;
    ret.new_letters = state.count_new_letters(word);
    ret.known_letters = state.count_known_letters(word);

    const bool large = num_candidates > m_config.exploration_threshold;

    // Reward testing new letters while the candidate space is still large.
    double exploration_bonus = 0;
    if (!stats.is_candidate_answer && large) {
        exploration_bonus = -m_config.new_letter_weight * ret.new_letters
            + m_config.known_letter_weight * ret.known_letters;
    }

    // Commit to a possible answer only in the endgame, otherwise prefer words
    // which eliminate.
    double answer_bonus = 0;
    if (stats.is_candidate_answer) {
        if (num_candidates <= m_config.endgame_size || turn >= m_config.late_turn)
            answer_bonus = -m_config.commit_bonus;
        else
            answer_bonus = m_config.early_answer_penalty;
    } else if (large) {
        answer_bonus = -m_config.elimination_bonus;
    }

    // The worst case is the primary objective, the average only breaks ties.
    ret.score = stats.max_bucket + stats.avg_bucket / 1000 + answer_bonus + exploration_bonus;
    return ret;
}

std::vector<scored_guess> solver::score_evaluation_set(const std::vector<std::string>& candidates,
                                                       int turn, const knowledge& state) const
{
    std::vector<std::string> words = evaluation_set(candidates, state);
    // Nothing qualified (e.g. every scanned word is a candidate), so consider
    // the candidates themselves.
    if (words.empty())
        words = candidates;

    std::vector<scored_guess> ret;
    ret.reserve(words.size());

    for (const std::string& word : words) {
        ret.push_back(score_guess(word, evaluate(word, candidates), candidates.size(),
                                  turn, state));
    }

    return ret;
}

std::vector<scored_guess> solver::rank_guesses(const std::vector<std::string>& candidates,
                                               int turn, const knowledge& state) const
{
    std::vector<scored_guess> ret = score_evaluation_set(candidates, turn, state);
    std::ranges::sort(ret, {}, &scored_guess::rank_key);
    return ret;
}

std::string solver::select_pair_splitter(const std::vector<std::string>& candidates) const
{
    const word_set lookup(candidates.begin(), candidates.end());
    std::optional<std::string> ret;

    for_each_non_candidate(lookup, m_config.pair_scan_limit, [&] (const std::string& word) {
        if (!ret && compute_feedback(word, candidates[0]) != compute_feedback(word, candidates[1]))
            ret = word;
    });

    // Nothing tells them apart, so take a coin flip on the first.
    return ret.value_or(candidates[0]);
}

std::string solver::select_guess(const std::vector<std::string>& candidates, int turn,
                                 const knowledge& state,
                                 const std::optional<std::string>& starter) const
{
    if (candidates.empty())
        throw std::runtime_error("Cannot select a guess with no candidates");

    switch (regime_for(candidates.size(), turn, starter.has_value())) {
    case regime::forced:
        return candidates[0];
    case regime::starter:
        return *starter;
    case regime::pair:
        return select_pair_splitter(candidates);
    default:
        break;
    }

    const std::vector<scored_guess> scored = score_evaluation_set(candidates, turn, state);
    const scored_guess& best = get_range_min<scored_guess>(scored, &scored_guess::rank_key);

    return best.word;
}

game_result solver::play(const std::string& target,
                         const std::optional<std::string>& starter) const
{
    check_word(target, "Target");
    if (starter)
        check_word(*starter, "Starter");

    game_result res;
    res.starter = starter;
    res.target = target;

    // Each game owns its candidates and knowledge, nothing is shared.
    std::vector<std::string> candidates = m_words;
    knowledge state;

    for (int turn = 1; turn <= m_config.max_turns; turn++) {
        const std::string guess = select_guess(candidates, turn, state, starter);
        const feedback fb = compute_feedback(guess, target);

        state = update_knowledge(std::move(state), guess, fb);

        if (fb.is_all_correct()) {
            res.history.push_back({ guess, fb, 1 });
            res.status = game_status::solved;
            return res;
        }

        candidates = filter_candidates(candidates, guess, fb);
        res.history.push_back({ guess, fb, candidates.size() });

        // Only possible if the target is not in the word list.
        if (candidates.empty()) {
            res.status = game_status::contradiction;
            return res;
        }
    }

    res.status = game_status::exhausted;
    return res;
}

void solver::check_word(const std::string& word, const char* what)
{
    if (word.size() != NUM_WORD_LETTERS) {
        std::ostringstream oss;

        oss << what << " '" << word << "' is of length " << word.size()
            << ", expected " << NUM_WORD_LETTERS;
        throw std::runtime_error(oss.str());
    }

    if (!is_upper_alpha(word)) {
        std::ostringstream oss;

        oss << what << " '" << word << "' contains characters other than A-Z";
        throw std::runtime_error(oss.str());
    }
}

void solver::check_config(const selector_config& config)
{
    if (config.max_turns < 1 || config.max_turns > NUM_ALLOWED_GUESSES) {
        std::ostringstream oss;

        oss << "Maximum turns of " << config.max_turns << " out of range, expected 1 to "
            << NUM_ALLOWED_GUESSES;
        throw std::runtime_error(oss.str());
    }

    if (config.exploration_threshold > config.elimination_threshold)
        throw std::runtime_error("Exploration threshold exceeds elimination threshold");
}

void solver::check_words(const std::vector<std::string>& words)
{
    if (words.empty())
        throw std::runtime_error("Empty word list");

    for (const std::string& word : words) {
        check_word(word, "Word");
    }
}
} // namespace opener
