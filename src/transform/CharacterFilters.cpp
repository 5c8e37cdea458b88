#include "CharacterFilters.hpp"
#include "CaseStyle.hpp"
#include "unicode/CharClass.hpp"
#include "unicode/Utf8.hpp"

namespace transform
{

namespace
{

template <typename Keep>
std::string keepIf(std::string_view text, Keep keep)
{
    if (isBlank(text))
        return std::string(text);

    std::string out;
    out.reserve(text.size());
    for (char32_t cp : unicode::utf8ToUtf32(text))
    {
        if (keep(cp))
            unicode::appendUtf8(out, cp);
    }
    return out;
}

bool isAsciiAlphanumeric(char32_t cp)
{
    return unicode::isAsciiLetter(cp) || unicode::isAsciiDigit(cp);
}

} // namespace

std::string removeNonAlphanumeric(std::string_view text)
{
    return keepIf(text, isAsciiAlphanumeric);
}

std::string removeNonAscii(std::string_view text)
{
    return keepIf(text, [](char32_t cp) { return cp <= 0x7Fu; });
}

std::string removeDigits(std::string_view text)
{
    return keepIf(text, [](char32_t cp) { return !unicode::isDigit(cp); });
}

std::string removeLetters(std::string_view text)
{
    return keepIf(text, [](char32_t cp) { return !unicode::isAsciiLetter(cp); });
}

std::string removeSpecialCharacters(std::string_view text)
{
    return keepIf(text, [](char32_t cp) { return isAsciiAlphanumeric(cp) || unicode::isWhitespace(cp); });
}

} // namespace transform
