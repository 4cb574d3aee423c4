#pragma once

#include "helpers.hh"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "boost/functional/hash.hpp"

namespace opener
{
static constexpr int NUM_WORD_LETTERS = 5;

// The three states of a single tile.
enum class mark : uint8_t
{
    absent = 0,
    present = 1,
    correct = 2,
};

// The per-position result of comparing a guess against a target.
struct feedback
{
    std::array<mark, NUM_WORD_LETTERS> marks = {};

    // There are 3 distinct states for each letter so 3^5 distinct patterns,
    // which fits comfortably in a byte.
    static constexpr int NUM_PATTERNS = raise_power(3, NUM_WORD_LETTERS);
    static_assert(NUM_PATTERNS <= UINT8_MAX + 1);

    static feedback all_correct()
    {
        feedback ret;
        ret.marks.fill(mark::correct);
        return ret;
    }

    bool is_all_correct() const
    {
        return std::ranges::all_of(marks, [] (mark m) { return m == mark::correct; });
    }

    int count(mark m) const
    {
        return static_cast<int>(std::ranges::count(marks, m));
    }

    // A unique base-3 value for this pattern in [0, NUM_PATTERNS).
    uint8_t value() const
    {
        int val = 0;
        int mult = 1;
        for (size_t i = 0; i < NUM_WORD_LETTERS; i++, mult *= 3) {
            val += static_cast<int>(marks[i]) * mult;
        }
        return static_cast<uint8_t>(val);
    }

    // Render as e.g. 'G.y..' (G - correct, y - present, . - absent).
    std::string to_string() const;

    bool operator==(const feedback&) const = default;
};

// The result of comparing `guess` against `target`. Correct letters are
// resolved first and consume their target occurrence; remaining guess letters
// then consume the first unconsumed occurrence of the same letter in the
// target, left to right.
feedback compute_feedback(const std::string& guess, const std::string& target);

// The candidates (in their original order) which would produce `fb` were they
// the target of `guess`.
std::vector<std::string> filter_candidates(const std::vector<std::string>& candidates,
                                           const std::string& guess,
                                           const feedback& fb);
} // namespace opener

// Permit use of feedback as an unordered map key.
namespace std
{
template<>
struct hash<opener::feedback>
{
    size_t operator()(const opener::feedback& fb) const
    {
        // The pattern value is already unique per pattern.
        size_t seed = 0;
        boost::hash_combine(seed, fb.value());
        return seed;
    }
};
} // namespace std

namespace opener
{
// Candidates grouped by the feedback a guess would produce against each.
using partition_t = std::unordered_map<feedback, std::vector<std::string>>;
} // namespace opener
