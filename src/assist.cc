#include "assist.hh"
#include "helpers.hh"

#include <algorithm>
#include <array>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{
using opener::mark;

// Number of candidates and ranked guesses shown at each turn.
constexpr size_t SHOW_CANDIDATES = 20;
constexpr size_t SHOW_RANKING = 8;

constexpr std::array<std::pair<std::string_view, char>, 5> COLOUR_WORDS = {{
    { "GREEN", 'G' },
    { "YELLOW", 'Y' },
    { "BLACK", 'B' },
    { "GRAY", 'B' },
    { "GREY", 'B' },
}};

constexpr std::array<std::pair<std::string_view, char>, 4> COLOUR_SQUARES = {{
    { "\xF0\x9F\x9F\xA9", 'G' }, // green square
    { "\xF0\x9F\x9F\xA8", 'Y' }, // yellow square
    { "\xE2\xAC\x9B", 'B' },     // black square
    { "\xE2\xAC\x9C", 'B' },     // white square
}};

void replace_all(std::string& str, std::string_view from, char to)
{
    for (size_t pos = str.find(from); pos != std::string::npos; pos = str.find(from, pos + 1)) {
        str.replace(pos, from.size(), 1, to);
    }
}

bool is_quit(const std::string& input)
{
    const std::string str = opener::upper_case(input);
    return str == "QUIT" || str == "EXIT" || str == "Q";
}

std::string join(const std::vector<std::string>& words, size_t max_count)
{
    std::string ret;
    const size_t num = std::min(max_count, words.size());

    for (size_t i = 0; i < num; i++) {
        if (i > 0)
            ret += ", ";
        ret += words[i];
    }
    if (num < words.size())
        ret += ", ... and " + std::to_string(words.size() - num) + " more";

    return ret;
}

std::string join_letters(const std::set<char>& letters)
{
    if (letters.empty())
        return "none";
    return std::string(letters.begin(), letters.end());
}
} // namespace

namespace opener
{
feedback parse_feedback_input(const std::string& input)
{
    std::string str = upper_case(input);
    std::erase_if(str, [] (char chr) { return chr == ' ' || chr == ',' || chr == '-'; });

    if (str == "WON" || str == "WIN" || str == "SOLVED")
        return feedback::all_correct();

    for (const auto& [ square, code ] : COLOUR_SQUARES) {
        replace_all(str, square, code);
    }
    for (const auto& [ word, code ] : COLOUR_WORDS) {
        replace_all(str, word, code);
    }

    if (str.size() != NUM_WORD_LETTERS)
        throw std::invalid_argument("Invalid feedback format: " + input);

    feedback ret;
    for (size_t i = 0; i < NUM_WORD_LETTERS; i++) {
        switch (str[i]) {
        case 'G':
        case '2':
            ret.marks[i] = mark::correct;
            break;
        case 'Y':
        case '1':
            ret.marks[i] = mark::present;
            break;
        case 'B':
        case '0':
            ret.marks[i] = mark::absent;
            break;
        default:
            throw std::invalid_argument("Invalid feedback format: " + input);
        }
    }

    return ret;
}

void run_assist(const solver& solv, const std::optional<std::string>& starter,
                std::istream& in)
{
    std::cout << "Enter the feedback for each suggested guess as e.g. GYBBB, 21000,"
              << " coloured squares or colour words ('quit' to exit)." << std::endl;

    std::vector<std::string> candidates = solv.words();
    std::vector<std::string> guesses;
    knowledge state;

    for (int turn = 1; turn <= solv.config().max_turns; turn++) {
        std::cout << std::endl << "--- turn " << turn << " ---" << std::endl;
        std::cout << "Possible words remaining: " << candidates.size() << std::endl;
        if (candidates.size() <= SHOW_CANDIDATES)
            std::cout << "Remaining: " << join(candidates, SHOW_CANDIDATES) << std::endl;

        const regime reg = solv.regime_for(candidates.size(), turn, starter.has_value());
        if (reg == regime::elimination || reg == regime::exploration || reg == regime::answer) {
            std::cout << "Top candidates (" << regime_name(reg) << "):" << std::endl;
            solver::print_ranking(solv.rank_guesses(candidates, turn, state), SHOW_RANKING);
        }

        const std::string guess = solv.select_guess(candidates, turn, state, starter);
        guesses.push_back(guess);
        std::cout << "Suggested guess: " << guess << std::endl;

        std::optional<feedback> fb;
        while (!fb) {
            std::cout << "Feedback: " << std::flush;

            std::string line;
            if (!std::getline(in, line) || is_quit(line))
                return;

            try {
                fb = parse_feedback_input(line);
            } catch (const std::invalid_argument& err) {
                std::cerr << "error: " << err.what() << std::endl;
            }
        }
        std::cout << "Interpreted as: " << fb->to_string() << std::endl;

        state = update_knowledge(std::move(state), guess, *fb);

        if (fb->is_all_correct()) {
            std::cout << "Solved in " << turn << ": " << join(guesses, guesses.size())
                      << std::endl;
            return;
        }

        candidates = filter_candidates(candidates, guess, *fb);

        std::cout << "Known letters: " << join_letters(state.known_letters)
                  << ", excluded: " << join_letters(state.excluded_letters)
                  << ", pattern: " << state.pattern_string() << std::endl;

        if (candidates.empty()) {
            std::cout << "No words remaining, either the feedback was mistyped or"
                      << " the answer is not in the word list." << std::endl;
            return;
        }
    }

    std::cout << "Not solved in " << solv.config().max_turns << ": "
              << join(guesses, guesses.size()) << std::endl;
    if (candidates.size() <= SHOW_CANDIDATES)
        std::cout << "Remaining: " << join(candidates, SHOW_CANDIDATES) << std::endl;
}
} // namespace opener
