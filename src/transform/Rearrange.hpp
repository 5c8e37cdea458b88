#pragma once

#include <random>
#include <string>
#include <string_view>

namespace transform
{

/// Reverses text by grapheme cluster, so combining sequences and emoji stay intact
[[nodiscard]] std::string reverse(std::string_view text);

/// Fisher-Yates shuffle of the grapheme clusters of text, driven by rng
[[nodiscard]] std::string shuffle(std::string_view text, std::mt19937& rng);

} // namespace transform
