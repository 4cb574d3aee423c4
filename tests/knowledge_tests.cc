#include "knowledge.hh"
#include "test_helpers.hh"
#include "test_words.hh"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

using opener::compute_feedback;
using opener::knowledge;
using opener::update_knowledge;

namespace
{
bool disjoint(const knowledge& state)
{
    return std::ranges::none_of(state.excluded_letters, [&] (char letter) {
        return state.is_known(letter);
    });
}

knowledge apply(knowledge state, const std::string& guess, const std::string& target)
{
    return update_knowledge(std::move(state), guess, compute_feedback(guess, target));
}

void test_marks()
{
    const knowledge state = apply({}, "SLATE", "CRANE");

    test::expect_true(state.known_letters == std::set<char>{ 'A', 'E' }, "A and E known");
    test::expect_true(state.excluded_letters == std::set<char>{ 'S', 'L', 'T' },
                      "S, L and T excluded");
    test::expect_equal(state.pattern_string(), "__A_E", "correct letters fixed in place");
    test::expect_true(state.wrong_positions.empty(), "nothing present yet");

    const knowledge next = apply(state, "NACRE", "CRANE");
    test::expect_true(next.known_letters == std::set<char>{ 'A', 'C', 'E', 'N', 'R' },
                      "present letters become known");
    test::expect_true(next.wrong_positions.at('N') == std::set<int>{ 0 },
                      "present N recorded as not at 0");
    test::expect_true(next.wrong_positions.at('R') == std::set<int>{ 3 },
                      "present R recorded as not at 3");
    test::expect_equal(next.pattern_string(), "__A_E", "earlier correct letters kept");
    test::expect_true(disjoint(next), "known and excluded disjoint");
}

void test_duplicate_in_guess()
{
    // The second E of EERIE is absent but the first is present, E must not
    // be excluded.
    const knowledge state = apply({}, "EERIE", "THREE");

    test::expect_true(state.is_known('E'), "E known");
    test::expect_false(state.is_excluded('E'), "E not excluded");
    test::expect_true(state.is_excluded('I'), "I excluded");
    test::expect_true(disjoint(state), "known and excluded disjoint");

    // SPEED against ERASE: the D and P are the only absent letters.
    const knowledge speed = apply({}, "SPEED", "ERASE");
    test::expect_true(speed.excluded_letters == std::set<char>{ 'D', 'P' }, "D and P excluded");
    test::expect_true(speed.wrong_positions.at('E') == std::set<int>{ 2, 3 },
                      "both Es recorded as misplaced");
}

void test_excluded_to_known()
{
    knowledge state;
    state.excluded_letters = { 'E', 'Z' };

    state = apply(std::move(state), "ERASE", "CRANE");

    test::expect_true(state.is_known('E'), "E now known");
    test::expect_false(state.is_excluded('E'), "E no longer excluded");
    test::expect_true(state.is_excluded('Z'), "unrelated exclusion kept");
    test::expect_true(disjoint(state), "known and excluded disjoint");
}

void test_monotonic()
{
    // Feed every word in as a guess against a fixed target, knowledge only
    // ever grows and the invariant always holds.
    for (const std::string& target : { "CRANE", "THREE", "SPEED" }) {
        knowledge state;

        for (const std::string& guess : test::WORDS) {
            const knowledge before = state;
            state = apply(std::move(state), guess, target);

            test::expect_true(disjoint(state), "disjoint after " + guess + "/" + target);
            test::expect_true(std::ranges::includes(state.known_letters, before.known_letters),
                              "known letters never lost after " + guess);
            for (size_t i = 0; i < opener::NUM_WORD_LETTERS; i++) {
                if (before.known_positions[i])
                    test::expect_true(state.known_positions[i] == before.known_positions[i],
                                      "known position never changes after " + guess);
            }
        }

        test::expect_equal(state.pattern_string(), target, "every position eventually known");
    }
}

void test_letter_counts()
{
    knowledge state;
    state.known_letters = { 'A', 'E' };
    state.excluded_letters = { 'S', 'T' };

    test::expect_equal(state.count_new_letters("CRANE"), 3, "C, R and N are new");
    test::expect_equal(state.count_known_letters("CRANE"), 2, "A and E known");
    test::expect_equal(state.count_new_letters("SPEED"), 2, "P and D are new, E counted once");
    test::expect_equal(state.count_known_letters("GREEN"), 1, "E counted once");
    test::expect_equal(state.count_new_letters("STATE"), 0, "nothing new");
}
} // namespace

int main()
{
    test_marks();
    test_duplicate_in_guess();
    test_excluded_to_known();
    test_monotonic();
    test_letter_counts();

    return test::report();
}
