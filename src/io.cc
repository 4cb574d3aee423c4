#include "io.hh"
#include "feedback.hh"
#include "helpers.hh"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
std::string normalise(const std::string& line)
{
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    const auto last = line.find_last_not_of(" \t\r\n");

    return opener::upper_case(line.substr(first, last - first + 1));
}
} // namespace

namespace opener
{
std::vector<std::string> read_words(const char* path)
{
    std::ifstream stream(path);
    if (!stream.is_open())
        throw std::runtime_error(std::string("Unable to open: ") + path);

    std::vector<std::string> lines;
    int num_rejected = 0;

    std::string line;
    while (std::getline(stream, line)) {
        const std::string word = normalise(line);
        if (word.size() != NUM_WORD_LETTERS)
            continue;

        if (!is_upper_alpha(word)) {
            std::cerr << "warning: skipping '" << word << "' in " << path
                      << ", not all letters are A-Z" << std::endl;
            num_rejected++;
            continue;
        }

        lines.push_back(word);
    }

    std::vector<std::string> ret;
    combine_words(ret, lines);

    if (ret.empty())
        throw std::runtime_error(std::string("No words in: ") + path);

    if (num_rejected > 0 || ret.size() != lines.size()) {
        std::cerr << "warning: " << path << ": rejected " << num_rejected
                  << ", dropped " << lines.size() - ret.size() << " duplicates" << std::endl;
    }

    return ret;
}
} // namespace opener
