#pragma once

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

namespace opener
{
// Compile-time function which recursively raises `value` to the power of
// `exponent`.
template<typename T>
static inline consteval T raise_power(T value, T exponent)
{
    return exponent <= 0 ? 1 : value * raise_power(value, exponent - 1);
}

// Wrapper function to obtain a reference to the minimum element in a range with
// the specified projection.
template<typename TRet, typename TRange, typename TProj>
static inline const TRet& get_range_min(const TRange& range, TProj&& proj)
{
    return *std::ranges::min_element(range.begin(), range.end(), {},
                                     std::forward<TProj>(proj));
}

// Helper function that places words from source to destination if they don't
// already exist there, preserving the order of first occurrence.
void combine_words(std::vector<std::string>& destination,
                   const std::vector<std::string>& source);

// The distinct letters of `word` in order of first occurrence.
std::string distinct_letters(const std::string& word);

std::string upper_case(std::string str);

// Does `word` consist only of the letters A-Z?
bool is_upper_alpha(const std::string& word);
} // namespace opener
