#include "CaseStyle.hpp"
#include "unicode/CharClass.hpp"
#include "unicode/Utf8.hpp"

#include <algorithm>
#include <regex>
#include <vector>

namespace transform
{

namespace
{

const std::regex& camelBoundary()
{
    static const std::regex pattern("([a-z])([A-Z])");
    return pattern;
}

const std::regex& wordSeparators()
{
    static const std::regex pattern(R"([\s_\-]+)");
    return pattern;
}

template <typename Mapping>
std::string mapCodePoints(std::string_view text, Mapping mapping)
{
    std::u32string code_points = unicode::utf8ToUtf32(text);
    for (size_t i = 0; i < code_points.size(); ++i)
        code_points[i] = mapping(code_points[i], i);
    return unicode::utf32ToUtf8(code_points);
}

std::vector<std::string> splitWords(std::string_view text)
{
    const std::string input(text);
    std::vector<std::string> words;
    std::sregex_token_iterator it(input.begin(), input.end(), wordSeparators(), -1);
    for (std::sregex_token_iterator end; it != end; ++it)
    {
        if (it->length() > 0)
            words.push_back(it->str());
    }
    return words;
}

std::string capitalize(const std::string& word)
{
    return mapCodePoints(word, [](char32_t cp, size_t i)
    {
        return i == 0 ? unicode::toUpper(cp) : unicode::toLower(cp);
    });
}

std::string separateWords(std::string_view text, char separator)
{
    const std::string replacement = std::string("$1") + separator + "$2";
    std::string result = std::regex_replace(std::string(text), camelBoundary(), replacement);
    std::replace_if(result.begin(), result.end(), [separator](char c)
    {
        return c != separator && (c == '_' || c == '-' || c == ' ');
    }, separator);
    return toLower(result);
}

template <typename FirstWord>
std::string joinWords(std::string_view text, FirstWord first_word, const std::string& glue)
{
    const std::vector<std::string> words = splitWords(text);
    if (words.empty())
        return std::string(text);

    std::string out = first_word(words.front());
    for (size_t i = 1; i < words.size(); ++i)
    {
        out += glue;
        out += capitalize(words[i]);
    }
    return out;
}

} // namespace

bool isBlank(std::string_view text)
{
    const std::u32string code_points = unicode::utf8ToUtf32(text);
    return std::all_of(code_points.begin(), code_points.end(), unicode::isWhitespace);
}

std::string toLower(std::string_view text)
{
    return mapCodePoints(text, [](char32_t cp, size_t) { return unicode::toLower(cp); });
}

std::string toUpper(std::string_view text)
{
    return mapCodePoints(text, [](char32_t cp, size_t) { return unicode::toUpper(cp); });
}

std::string toSnakeCase(std::string_view text)
{
    if (isBlank(text))
        return std::string(text);
    return separateWords(text, '_');
}

std::string toKebabCase(std::string_view text)
{
    if (isBlank(text))
        return std::string(text);
    return separateWords(text, '-');
}

std::string toCamelCase(std::string_view text)
{
    if (isBlank(text))
        return std::string(text);
    return joinWords(text, [](const std::string& w) { return toLower(w); }, "");
}

std::string toPascalCase(std::string_view text)
{
    if (isBlank(text))
        return std::string(text);
    return joinWords(text, capitalize, "");
}

std::string toTitleCase(std::string_view text)
{
    if (isBlank(text))
        return std::string(text);
    return joinWords(text, capitalize, " ");
}

std::string swapCase(std::string_view text)
{
    if (isBlank(text))
        return std::string(text);

    return mapCodePoints(text, [](char32_t cp, size_t)
    {
        if (unicode::isUpper(cp))
            return unicode::toLower(cp);
        if (unicode::isLower(cp))
            return unicode::toUpper(cp);
        return cp;
    });
}

std::string toSarcasm(std::string_view text)
{
    return mapCodePoints(text, [](char32_t cp, size_t i)
    {
        return i % 2 == 0 ? unicode::toLower(cp) : unicode::toUpper(cp);
    });
}

} // namespace transform
