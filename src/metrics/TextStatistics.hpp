#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace metrics
{

// Every metric of the library for one input, computed in one call
struct TextStatistics
{
    std::size_t code_units = 0;
    std::size_t code_points = 0;
    std::size_t graphemes = 0;
    std::size_t words = 0;
    std::size_t sentences = 0;
    std::size_t paragraphs = 0;
    std::size_t vowels = 0;
    std::size_t consonants = 0;
    std::size_t digits = 0;
    std::size_t uppercase = 0;
    std::size_t lowercase = 0;
    std::size_t whitespace = 0;
    std::size_t punctuation = 0;
    std::string most_frequent_character;
    std::string least_frequent_character;
    std::string most_frequent_word;
    std::string least_frequent_word;
};

[[nodiscard]] TextStatistics analyze(std::string_view text);

/// One "name: value" line per field
[[nodiscard]] std::string formatStatistics(const TextStatistics& stats);

} // namespace metrics
