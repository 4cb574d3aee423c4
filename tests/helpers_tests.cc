#include "helpers.hh"
#include "test_helpers.hh"

#include <string>
#include <vector>

using opener::is_upper_alpha;
using opener::upper_case;

namespace
{
void test_upper_case()
{
    test::expect_equal(upper_case("crane"), "CRANE", "lower case upper cased");
    test::expect_equal(upper_case("Slate"), "SLATE", "mixed case upper cased");
    test::expect_equal(upper_case("won!"), "WON!", "non-letters unchanged");
    test::expect_equal(upper_case(""), "", "empty string");
}

void test_is_upper_alpha()
{
    test::expect_true(is_upper_alpha("CRANE"), "A-Z only");
    test::expect_false(is_upper_alpha("Crane"), "lower case rejected");
    test::expect_false(is_upper_alpha("CR4NE"), "digit rejected");
    test::expect_false(is_upper_alpha("CR NE"), "space rejected");
    test::expect_false(is_upper_alpha("CR\xC3\x89NE"), "accented letter rejected");
}

void test_words()
{
    test::expect_equal(opener::distinct_letters("SPEED"), "SPED", "first occurrences kept in order");
    test::expect_equal(opener::distinct_letters("CRANE"), "CRANE", "no repeats");

    std::vector<std::string> dest = { "CRANE", "SLATE" };
    opener::combine_words(dest, { "AUDIO", "CRANE", "AUDIO", "ZEBRA" });
    const std::vector<std::string> expected = { "CRANE", "SLATE", "AUDIO", "ZEBRA" };
    test::expect_true(dest == expected, "only new words appended, in order");
}
} // namespace

int main()
{
    test_upper_case();
    test_is_upper_alpha();
    test_words();

    return test::report();
}
