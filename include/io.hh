#pragma once

#include <string>
#include <vector>

namespace opener
{
// Read an ordered word list, one word per line. Words are trimmed and upper
// cased, lines which are not 5 letters long are skipped and duplicates are
// dropped. Throws std::runtime_error if the file cannot be read or holds no
// words.
std::vector<std::string> read_words(const char* path);
} // namespace opener
