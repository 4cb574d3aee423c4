#pragma once

#include "feedback.hh"

#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace opener
{
// What has been learned about the target over the turns of one game. This is
// a value threaded through the game loop: each update returns a new state.
struct knowledge
{
    // Letters confirmed to be somewhere in the target.
    std::set<char> known_letters;
    // Letters confirmed at a specific position (correct marks only).
    std::array<std::optional<char>, NUM_WORD_LETTERS> known_positions;
    // Letters confirmed absent. Never intersects known_letters.
    std::set<char> excluded_letters;
    // For present letters, positions known not to hold them.
    std::map<char, std::set<int>> wrong_positions;

    bool is_known(char letter) const
    {
        return known_letters.contains(letter);
    }

    bool is_excluded(char letter) const
    {
        return excluded_letters.contains(letter);
    }

    // Number of distinct letters of `word` that are neither known nor
    // excluded, i.e. letters a guess of `word` would tell us something new
    // about.
    int count_new_letters(const std::string& word) const;

    // Number of distinct letters of `word` already known to be present.
    int count_known_letters(const std::string& word) const;

    // Known positions rendered as e.g. 'C_A__'.
    std::string pattern_string() const;
};

// Fold a guess and its feedback into `state`. Correct and present marks are
// applied before absent marks so that a letter absent at one occurrence but
// correct or present at another is never excluded.
knowledge update_knowledge(knowledge state, const std::string& guess, const feedback& fb);
} // namespace opener
