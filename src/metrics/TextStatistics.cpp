#include "TextStatistics.hpp"
#include "CharacterCounts.hpp"
#include "FrequencyAnalysis.hpp"
#include "Segmentation.hpp"

#include <sstream>

namespace metrics
{

TextStatistics analyze(std::string_view text)
{
    TextStatistics stats;
    stats.code_units = codeUnitLength(text);
    stats.code_points = codePointLength(text);
    stats.graphemes = logicalLength(text);
    stats.words = countWords(text);
    stats.sentences = countSentences(text);
    stats.paragraphs = countParagraphs(text);
    stats.vowels = countVowels(text);
    stats.consonants = countConsonants(text);
    stats.digits = countDigits(text);
    stats.uppercase = countUppercase(text);
    stats.lowercase = countLowercase(text);
    stats.whitespace = countWhitespace(text);
    stats.punctuation = countPunctuation(text);
    stats.most_frequent_character = mostFrequentCharacter(text);
    stats.least_frequent_character = leastFrequentCharacter(text);
    stats.most_frequent_word = mostFrequentWord(text);
    stats.least_frequent_word = leastFrequentWord(text);
    return stats;
}

std::string formatStatistics(const TextStatistics& stats)
{
    std::ostringstream oss;
    oss << "bytes: " << stats.code_units << "\n"
        << "code points: " << stats.code_points << "\n"
        << "graphemes: " << stats.graphemes << "\n"
        << "words: " << stats.words << "\n"
        << "sentences: " << stats.sentences << "\n"
        << "paragraphs: " << stats.paragraphs << "\n"
        << "vowels: " << stats.vowels << "\n"
        << "consonants: " << stats.consonants << "\n"
        << "digits: " << stats.digits << "\n"
        << "uppercase: " << stats.uppercase << "\n"
        << "lowercase: " << stats.lowercase << "\n"
        << "whitespace: " << stats.whitespace << "\n"
        << "punctuation: " << stats.punctuation << "\n"
        << "most frequent character: " << stats.most_frequent_character << "\n"
        << "least frequent character: " << stats.least_frequent_character << "\n"
        << "most frequent word: " << stats.most_frequent_word << "\n"
        << "least frequent word: " << stats.least_frequent_word;
    return oss.str();
}

} // namespace metrics
