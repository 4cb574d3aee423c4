#include "feedback.hh"

#include <array>
#include <string>
#include <vector>

namespace opener
{
std::string feedback::to_string() const
{
    std::string ret(NUM_WORD_LETTERS, '.');

    for (size_t i = 0; i < NUM_WORD_LETTERS; i++) {
        switch (marks[i]) {
        case mark::correct:
            ret[i] = 'G';
            break;
        case mark::present:
            ret[i] = 'y';
            break;
        case mark::absent:
            break;
        }
    }

    return ret;
}

feedback compute_feedback(const std::string& guess, const std::string& target)
{
    feedback ret;

    // Target letters already accounted for by a correct or present mark.
    std::array<bool, NUM_WORD_LETTERS> consumed = {};

    // Correct letters first. These consume their target letter before any
    // present letter gets a chance to, otherwise e.g. 'EERIE' against 'THREE'
    // would mark both leading Es present, leaving no E for the exact match in
    // the final position.
    for (size_t i = 0; i < NUM_WORD_LETTERS; i++) {
        if (guess[i] == target[i]) {
            ret.marks[i] = mark::correct;
            consumed[i] = true;
        }
    }

    // Each remaining guess letter takes the first unconsumed occurrence of the
    // same letter, if any.
    for (size_t i = 0; i < NUM_WORD_LETTERS; i++) {
        if (ret.marks[i] == mark::correct)
            continue;

        for (size_t j = 0; j < NUM_WORD_LETTERS; j++) {
            if (!consumed[j] && target[j] == guess[i]) {
                ret.marks[i] = mark::present;
                consumed[j] = true;
                break;
            }
        }
    }

    return ret;
}

std::vector<std::string> filter_candidates(const std::vector<std::string>& candidates,
                                           const std::string& guess,
                                           const feedback& fb)
{
    std::vector<std::string> ret;

    for (const std::string& candidate : candidates) {
        if (compute_feedback(guess, candidate) == fb)
            ret.push_back(candidate);
    }

    return ret;
}
} // namespace opener
