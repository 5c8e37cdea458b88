#include "Segmentation.hpp"
#include "unicode/CharClass.hpp"
#include "unicode/Utf8.hpp"

#include <algorithm>

namespace metrics
{

namespace
{

constexpr std::string_view kWordDelimiters = " \t\n\r";
constexpr std::string_view kTokenDelimiters = " \t\n\r.,!?";
constexpr std::string_view kSentenceDelimiters = ".!?";

constexpr char32_t kLineSeparator = 0x2028;
constexpr char32_t kParagraphSeparator = 0x2029;
constexpr char32_t kNextLine = 0x0085;

// Split on any single delimiter character, dropping empty segments
std::vector<std::string_view> splitOnAny(std::string_view text, std::string_view delimiters)
{
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start < text.size())
    {
        size_t end = text.find_first_of(delimiters, start);
        if (end == std::string_view::npos)
            end = text.size();
        if (end > start)
            segments.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

bool isBlank(std::string_view segment)
{
    const std::u32string code_points = unicode::utf8ToUtf32(segment);
    return std::all_of(code_points.begin(), code_points.end(), unicode::isWhitespace);
}

} // namespace

std::vector<std::string_view> splitWords(std::string_view text)
{
    return splitOnAny(text, kWordDelimiters);
}

std::vector<std::string_view> splitWordTokens(std::string_view text)
{
    return splitOnAny(text, kTokenDelimiters);
}

std::size_t countWords(std::string_view text)
{
    return splitWords(text).size();
}

std::size_t countSentences(std::string_view text)
{
    if (isBlank(text))
        return 0;
    return splitOnAny(text, kSentenceDelimiters).size();
}

std::size_t countParagraphs(std::string_view text)
{
    const std::u32string code_points = unicode::utf8ToUtf32(text);

    std::size_t paragraphs = 0;
    std::size_t breaks = 0;
    bool seen_content = false;

    for (size_t i = 0; i < code_points.size(); ++i)
    {
        const char32_t cp = code_points[i];

        if (cp == U'\r' || cp == U'\n' || cp == kLineSeparator || cp == kNextLine)
        {
            if (cp == U'\r' && i + 1 < code_points.size() && code_points[i + 1] == U'\n')
                ++i;
            ++breaks;
            continue;
        }
        if (cp == kParagraphSeparator)
        {
            breaks = std::max<std::size_t>(breaks + 1, 2);
            continue;
        }
        if (unicode::isWhitespace(cp))
            continue;

        if (!seen_content || breaks >= 2)
            ++paragraphs;
        seen_content = true;
        breaks = 0;
    }

    return paragraphs;
}

} // namespace metrics
