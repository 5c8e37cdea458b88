#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace unicode
{

/// Split UTF-8 text into extended grapheme clusters, each returned as its UTF-8 bytes.
/// Ill-formed bytes are treated as U+FFFD and form their own clusters.
std::vector<std::string> splitGraphemes(std::string_view text);

/// Number of extended grapheme clusters in text
[[nodiscard]] std::size_t countGraphemes(std::string_view text);

/// NFC normalization via utf8proc. Returns the input unchanged when utf8proc rejects it.
[[nodiscard]] std::string normalizeNfc(const std::string& text);

} // namespace unicode
