#pragma once

#include "CodecResult.hpp"

#include <string>
#include <string_view>

namespace codec
{

/// Each code point as a zero-padded base-2 literal of at least 8 digits, space separated.
/// Code points above U+00FF yield wider tokens that fromBinary rejects, so only ASCII
/// text survives a round trip.
[[nodiscard]] std::string toBinary(std::string_view text);

/// Parses space-separated 8-bit literals and decodes the bytes as ASCII.
/// Bytes above 0x7F become '?'.
[[nodiscard]] TextResult fromBinary(std::string_view binary);

} // namespace codec
