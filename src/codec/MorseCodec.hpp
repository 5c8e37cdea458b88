#pragma once

#include <string>
#include <string_view>

namespace codec
{

/// Upper-cases text, silently drops anything outside A-Z / 0-9 and joins the
/// Morse tokens with single spaces.
[[nodiscard]] std::string toMorse(std::string_view text);

/// Splits on single spaces and concatenates the symbols of known tokens; unknown
/// tokens are dropped. Lossy: never fails.
[[nodiscard]] std::string fromMorse(std::string_view morse);

} // namespace codec
