#include "CharacterCounts.hpp"
#include "unicode/CharClass.hpp"
#include "unicode/Graphemes.hpp"
#include "unicode/Utf8.hpp"

#include <algorithm>

namespace metrics
{

namespace
{

template <typename Predicate>
std::size_t countIf(std::string_view text, Predicate predicate)
{
    const std::u32string code_points = unicode::utf8ToUtf32(text);
    return static_cast<std::size_t>(std::count_if(code_points.begin(), code_points.end(), predicate));
}

} // namespace

std::size_t countCharacters(std::string_view text)
{
    return codePointLength(text);
}

std::size_t countVowels(std::string_view text)
{
    return countIf(text, unicode::isVowel);
}

std::size_t countConsonants(std::string_view text)
{
    return countIf(text, [](char32_t cp) { return unicode::isLetter(cp) && !unicode::isVowel(cp); });
}

std::size_t countDigits(std::string_view text)
{
    return countIf(text, unicode::isDigit);
}

std::size_t countUppercase(std::string_view text)
{
    return countIf(text, unicode::isUpper);
}

std::size_t countLowercase(std::string_view text)
{
    return countIf(text, unicode::isLower);
}

std::size_t countWhitespace(std::string_view text)
{
    return countIf(text, unicode::isWhitespace);
}

std::size_t countPunctuation(std::string_view text)
{
    return countIf(text, unicode::isPunctuation);
}

std::size_t codeUnitLength(std::string_view text)
{
    return text.size();
}

std::size_t codePointLength(std::string_view text)
{
    std::size_t count = 0;
    size_t index = 0;
    while (index < text.size())
    {
        // an ill-formed sequence still counts once, as U+FFFD
        uint32_t codepoint = 0;
        static_cast<void>(unicode::decodeNextUtf8(text, index, codepoint));
        ++count;
    }
    return count;
}

std::size_t logicalLength(std::string_view text)
{
    return unicode::countGraphemes(text);
}

} // namespace metrics
