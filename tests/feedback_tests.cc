#include "feedback.hh"
#include "solver.hh"
#include "test_helpers.hh"
#include "test_words.hh"

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

using opener::compute_feedback;
using opener::feedback;
using opener::mark;

namespace
{
std::string pattern_for(const std::string& guess, const std::string& target)
{
    return compute_feedback(guess, target).to_string();
}

void test_basic_patterns()
{
    test::expect_equal(pattern_for("CRANE", "CRANE"), "GGGGG", "exact match is all correct");
    test::expect_equal(pattern_for("BUMPY", "CRANE"), ".....", "no shared letters is all absent");
    test::expect_equal(pattern_for("SLATE", "CRANE"), "..G.G", "correct letters in place");
    test::expect_equal(pattern_for("NACRE", "CRANE"), "yyyyG", "misplaced letters are present");
}

void test_duplicate_letters()
{
    // S is present once, both Es find one of ERASE's two Es.
    test::expect_equal(pattern_for("SPEED", "ERASE"), "y.yy.",
                       "SPEED against ERASE consumes one target letter per mark");

    // The final E is an exact match and takes its E first, leaving one E for
    // the first guess E and none for the second.
    test::expect_equal(pattern_for("EERIE", "THREE"), "y.G.G",
                       "correct letters are consumed before present ones");

    // Only one L in the target, the first unresolved L takes it.
    test::expect_equal(pattern_for("LLAMA", "PLANT"), ".GG..",
                       "a correct L leaves nothing for the other L");
    test::expect_equal(pattern_for("SKILL", "LEAST"), "y..y.",
                       "a single target letter is only marked present once");
}

void test_properties()
{
    for (const std::string& guess : test::WORDS) {
        for (const std::string& target : test::WORDS) {
            const feedback fb = compute_feedback(guess, target);

            int matching = 0;
            for (size_t i = 0; i < opener::NUM_WORD_LETTERS; i++) {
                if (guess[i] == target[i])
                    matching++;
            }
            test::expect_equal(fb.count(mark::correct), matching,
                               "correct count for " + guess + "/" + target);

            std::map<char, int> marked;
            for (size_t i = 0; i < opener::NUM_WORD_LETTERS; i++) {
                if (fb.marks[i] != mark::absent)
                    marked[guess[i]]++;
            }
            for (const auto& [ letter, count ] : marked) {
                const auto occurrences = std::ranges::count(target, letter);
                test::expect_true(count <= occurrences,
                                  "letter over-counted for " + guess + "/" + target);
            }

            test::expect_equal(fb.is_all_correct(), guess == target,
                               "all correct iff equal for " + guess + "/" + target);
        }
    }
}

void test_pattern_values()
{
    std::unordered_set<int> values;
    std::unordered_set<feedback> patterns;

    for (const std::string& target : test::WORDS) {
        const feedback fb = compute_feedback("CRANE", target);
        values.insert(fb.value());
        patterns.insert(fb);
    }

    test::expect_equal(values.size(), patterns.size(), "pattern values are unique per pattern");
    test::expect_equal(static_cast<int>(feedback::all_correct().value()),
                       feedback::NUM_PATTERNS - 1, "all correct is the largest value");

    // Every possible pattern has its own value and its own hash.
    std::unordered_set<int> all_values;
    std::unordered_set<size_t> all_hashes;
    const std::hash<feedback> hasher;
    for (int n = 0; n < feedback::NUM_PATTERNS; n++) {
        feedback fb;
        int rest = n;
        for (size_t i = 0; i < opener::NUM_WORD_LETTERS; i++, rest /= 3) {
            fb.marks[i] = static_cast<mark>(rest % 3);
        }

        test::expect_equal(static_cast<int>(fb.value()), n, "value is the base-3 encoding");
        all_values.insert(fb.value());
        all_hashes.insert(hasher(fb));
    }
    test::expect_equal(all_values.size(), static_cast<size_t>(feedback::NUM_PATTERNS),
                       "one value per pattern");
    test::expect_equal(all_hashes.size(), static_cast<size_t>(feedback::NUM_PATTERNS),
                       "one hash per pattern");
}

void test_filter()
{
    const feedback fb = compute_feedback("SLATE", "CRANE");
    const std::vector<std::string> filtered = opener::filter_candidates(test::WORDS, "SLATE", fb);

    const std::vector<std::string> expected = {
        "BRAKE", "BRAVE", "CRANE", "CRAVE", "CRAZE",
        "DRAKE", "FRAME", "GRACE", "GRADE", "GRAPE",
    };
    test::expect_true(filtered == expected, "filter keeps consistent words in order");

    for (const std::string& guess : { "SLATE", "AUDIO", "ZEBRA" }) {
        for (const std::string& target : test::WORDS) {
            const auto narrowed = opener::filter_candidates(
                test::WORDS, guess, compute_feedback(guess, target));

            test::expect_true(narrowed.size() <= test::WORDS.size(), "filter never grows");
            test::expect_true(std::ranges::find(narrowed, target) != narrowed.end(),
                              "filter keeps the target");
        }
    }

    test::expect_true(opener::filter_candidates({}, "SLATE", fb).empty(),
                      "filtering nothing gives nothing");
}

void test_partition()
{
    const std::vector<std::string> candidates = { "CRANE", "CRAVE", "CRAZE", "GRACE" };
    const opener::partition_t buckets = opener::solver::partition("BRAVE", candidates);

    test::expect_equal(buckets.size(), 2u, "BRAVE splits the candidates in two");

    size_t total = 0;
    for (const auto& [ fb, words ] : buckets) {
        total += words.size();
        for (const std::string& word : words) {
            test::expect_true(compute_feedback("BRAVE", word) == fb,
                              "bucket members produce their key");
        }
    }
    test::expect_equal(total, candidates.size(), "buckets cover the candidates");
}
} // namespace

int main()
{
    test_basic_patterns();
    test_duplicate_letters();
    test_properties();
    test_pattern_values();
    test_filter();
    test_partition();

    return test::report();
}
