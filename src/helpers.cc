#include "helpers.hh"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <vector>

namespace opener
{
void combine_words(std::vector<std::string>& destination,
                   const std::vector<std::string>& source)
{
    std::unordered_set existing_set(destination.begin(), destination.end());

    for (const std::string& str : source) {
        if (!existing_set.contains(str)) {
            destination.push_back(str);
            existing_set.insert(str);
        }
    }
}

std::string distinct_letters(const std::string& word)
{
    std::string ret;
    ret.reserve(word.size());

    for (const char chr : word) {
        if (ret.find(chr) == std::string::npos)
            ret.push_back(chr);
    }

    return ret;
}

std::string upper_case(std::string str)
{
    std::ranges::transform(str, str.begin(), [] (unsigned char chr) {
        return static_cast<char>(std::toupper(chr));
    });
    return str;
}

bool is_upper_alpha(const std::string& word)
{
    return std::ranges::all_of(word, [] (char chr) { return chr >= 'A' && chr <= 'Z'; });
}
} // namespace opener
