#pragma once

#include <string>
#include <string_view>

namespace metrics
{

// Most/least frequent letter-or-digit code point and word token. Ties resolve to the
// candidate seen first in the input. No candidates yields an empty string.

[[nodiscard]] std::string mostFrequentCharacter(std::string_view text);
[[nodiscard]] std::string leastFrequentCharacter(std::string_view text);

/// Tokens come from splitWordTokens and are grouped case-sensitively
[[nodiscard]] std::string mostFrequentWord(std::string_view text);
[[nodiscard]] std::string leastFrequentWord(std::string_view text);

} // namespace metrics
