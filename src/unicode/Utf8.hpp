#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace unicode
{

constexpr char32_t kReplacementChar = U'\uFFFD';

/// UTF-8 to UTF-32 conversion; ill-formed sequences become U+FFFD
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion; invalid scalar values are skipped
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Append one code point to a UTF-8 string
void appendUtf8(std::string& out, char32_t cp);

/// Decode one code point starting at index. Advances index past the consumed bytes
/// and returns false if the sequence at index is ill-formed.
bool decodeNextUtf8(std::string_view text, size_t& index, uint32_t& codepoint);

/// True when text is well-formed UTF-8 (no overlongs, surrogates or values past U+10FFFF)
[[nodiscard]] bool isValidUtf8(std::string_view text);

[[nodiscard]] constexpr bool isSurrogate(uint32_t cp)
{
    return cp >= 0xD800u && cp <= 0xDFFFu;
}

} // namespace unicode
