#pragma once

#include <cstddef>
#include <string_view>

namespace metrics
{

// Per-code-point counts over UTF-8 text. Ill-formed bytes count as U+FFFD, which
// belongs to none of the classes below except the code point total.

[[nodiscard]] std::size_t countCharacters(std::string_view text);
[[nodiscard]] std::size_t countVowels(std::string_view text);
[[nodiscard]] std::size_t countConsonants(std::string_view text);
[[nodiscard]] std::size_t countDigits(std::string_view text);
[[nodiscard]] std::size_t countUppercase(std::string_view text);
[[nodiscard]] std::size_t countLowercase(std::string_view text);
[[nodiscard]] std::size_t countWhitespace(std::string_view text);
[[nodiscard]] std::size_t countPunctuation(std::string_view text);

/// UTF-8 bytes
[[nodiscard]] std::size_t codeUnitLength(std::string_view text);

/// Unicode scalar values
[[nodiscard]] std::size_t codePointLength(std::string_view text);

/// User-perceived characters (extended grapheme clusters). Expects NFC input; other
/// input is counted as-is.
[[nodiscard]] std::size_t logicalLength(std::string_view text);

} // namespace metrics
