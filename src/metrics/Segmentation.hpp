#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace metrics
{

/// Non-empty segments of text split on space, tab, '\n' and '\r'
std::vector<std::string_view> splitWords(std::string_view text);

/// Non-empty tokens of text split on space, tab, '\n', '\r', '.', ',', '!' and '?'
std::vector<std::string_view> splitWordTokens(std::string_view text);

[[nodiscard]] std::size_t countWords(std::string_view text);

/// Non-empty segments between '.', '!' and '?'; zero when text is blank.
/// Each mark is its own delimiter, so "Wait... really?!" counts two sentences, and a
/// space after the last mark is a segment of its own ("Hello. World. " counts three).
[[nodiscard]] std::size_t countSentences(std::string_view text);

/// Paragraphs start at the first non-whitespace code point of the text and at the first
/// non-whitespace code point after two or more consecutive line breaks. "\r\n" is one
/// break; U+2028 and U+0085 are breaks; U+2029 ends a paragraph by itself. Whitespace
/// between breaks does not interrupt a run of breaks.
[[nodiscard]] std::size_t countParagraphs(std::string_view text);

} // namespace metrics
