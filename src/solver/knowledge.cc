#include "knowledge.hh"

#include <string>

namespace opener
{
int knowledge::count_new_letters(const std::string& word) const
{
    int ret = 0;
    for (const char letter : distinct_letters(word)) {
        if (!is_known(letter) && !is_excluded(letter))
            ret++;
    }
    return ret;
}

int knowledge::count_known_letters(const std::string& word) const
{
    int ret = 0;
    for (const char letter : distinct_letters(word)) {
        if (is_known(letter))
            ret++;
    }
    return ret;
}

std::string knowledge::pattern_string() const
{
    std::string ret(NUM_WORD_LETTERS, '_');
    for (size_t i = 0; i < NUM_WORD_LETTERS; i++) {
        if (known_positions[i])
            ret[i] = *known_positions[i];
    }
    return ret;
}

knowledge update_knowledge(knowledge state, const std::string& guess, const feedback& fb)
{
    // Positive evidence first, so that the absent pass below can see every
    // letter this guess confirmed.
    for (size_t i = 0; i < NUM_WORD_LETTERS; i++) {
        const char letter = guess[i];

        switch (fb.marks[i]) {
        case mark::correct:
            state.known_positions[i] = letter;
            break;
        case mark::present:
            state.wrong_positions[letter].insert(static_cast<int>(i));
            break;
        case mark::absent:
            continue;
        }

        state.known_letters.insert(letter);
        // Confirmed present letters can never stay excluded.
        state.excluded_letters.erase(letter);
    }

    for (size_t i = 0; i < NUM_WORD_LETTERS; i++) {
        const char letter = guess[i];

        // An absent mark on a known letter only means there are no further
        // occurrences of it.
        if (fb.marks[i] == mark::absent && !state.is_known(letter))
            state.excluded_letters.insert(letter);
    }

    return state;
}
} // namespace opener
