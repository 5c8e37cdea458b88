#pragma once

namespace unicode
{

// Classification per the Unicode Character Database (utf8proc general categories).

/// Lu, Ll, Lt, Lm, Lo
[[nodiscard]] bool isLetter(char32_t cp);

/// Nd
[[nodiscard]] bool isDigit(char32_t cp);

[[nodiscard]] bool isLetterOrDigit(char32_t cp);

/// Lu
[[nodiscard]] bool isUpper(char32_t cp);

/// Ll
[[nodiscard]] bool isLower(char32_t cp);

/// Pc, Pd, Ps, Pe, Pi, Pf, Po
[[nodiscard]] bool isPunctuation(char32_t cp);

/// Zs, Zl, Zp plus the C0 controls U+0009-U+000D and U+0085
[[nodiscard]] bool isWhitespace(char32_t cp);

/// One of aeiouAEIOU
[[nodiscard]] bool isVowel(char32_t cp);

[[nodiscard]] constexpr bool isAsciiLetter(char32_t cp)
{
    return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

[[nodiscard]] constexpr bool isAsciiDigit(char32_t cp)
{
    return cp >= U'0' && cp <= U'9';
}

/// Simple (single code point) case mappings
[[nodiscard]] char32_t toUpper(char32_t cp);
[[nodiscard]] char32_t toLower(char32_t cp);

} // namespace unicode
