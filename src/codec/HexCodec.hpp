#pragma once

#include "CodecResult.hpp"

#include <string>
#include <string_view>

namespace codec
{

/// Each UTF-8 byte of text as two uppercase hex digits, no separator
[[nodiscard]] std::string toHex(std::string_view text);

/// Inverse of toHex. Accepts either digit case; the decoded bytes must be valid UTF-8.
[[nodiscard]] TextResult fromHex(std::string_view hex);

} // namespace codec
