#pragma once

#include "CodecResult.hpp"

#include <string>
#include <string_view>

namespace codec
{

/// RFC 4648 standard alphabet with '=' padding
[[nodiscard]] std::string base64Encode(const Bytes& bytes);

/// Strict inverse of base64Encode. ASCII whitespace is skipped; any other character
/// outside the alphabet, misplaced padding or a truncated quantum fails with InvalidBase64.
[[nodiscard]] BytesResult base64Decode(std::string_view text);

} // namespace codec
