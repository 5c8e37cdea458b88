#include "CharClass.hpp"
#include <utf8proc.h>

namespace unicode
{

namespace
{

utf8proc_category_t categoryOf(char32_t cp)
{
    return utf8proc_category(static_cast<utf8proc_int32_t>(cp));
}

} // namespace

bool isLetter(char32_t cp)
{
    switch (categoryOf(cp))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
        return true;
    default:
        return false;
    }
}

bool isDigit(char32_t cp)
{
    return categoryOf(cp) == UTF8PROC_CATEGORY_ND;
}

bool isLetterOrDigit(char32_t cp)
{
    return isLetter(cp) || isDigit(cp);
}

bool isUpper(char32_t cp)
{
    return categoryOf(cp) == UTF8PROC_CATEGORY_LU;
}

bool isLower(char32_t cp)
{
    return categoryOf(cp) == UTF8PROC_CATEGORY_LL;
}

bool isPunctuation(char32_t cp)
{
    switch (categoryOf(cp))
    {
    case UTF8PROC_CATEGORY_PC:
    case UTF8PROC_CATEGORY_PD:
    case UTF8PROC_CATEGORY_PS:
    case UTF8PROC_CATEGORY_PE:
    case UTF8PROC_CATEGORY_PI:
    case UTF8PROC_CATEGORY_PF:
    case UTF8PROC_CATEGORY_PO:
        return true;
    default:
        return false;
    }
}

bool isWhitespace(char32_t cp)
{
    if ((cp >= 0x0009u && cp <= 0x000Du) || cp == 0x0085u)
        return true;

    switch (categoryOf(cp))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

bool isVowel(char32_t cp)
{
    switch (cp)
    {
    case U'a':
    case U'e':
    case U'i':
    case U'o':
    case U'u':
    case U'A':
    case U'E':
    case U'I':
    case U'O':
    case U'U':
        return true;
    default:
        return false;
    }
}

char32_t toUpper(char32_t cp)
{
    return static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(cp)));
}

char32_t toLower(char32_t cp)
{
    return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
}

} // namespace unicode
