#pragma once

#include <string>
#include <string_view>

namespace transform
{

// Character removal filters. Input that is empty or only whitespace is returned as-is.

[[nodiscard]] std::string removeNonAlphanumeric(std::string_view text);   // keeps [a-zA-Z0-9]
[[nodiscard]] std::string removeNonAscii(std::string_view text);          // keeps U+0000-U+007F
[[nodiscard]] std::string removeDigits(std::string_view text);            // drops Unicode Nd
[[nodiscard]] std::string removeLetters(std::string_view text);           // drops [a-zA-Z]
[[nodiscard]] std::string removeSpecialCharacters(std::string_view text); // keeps [a-zA-Z0-9] and whitespace

} // namespace transform
