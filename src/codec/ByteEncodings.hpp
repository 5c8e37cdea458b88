#pragma once

#include "CodecResult.hpp"

#include <string>
#include <string_view>

namespace codec
{

// Text <-> byte conversions for the fixed encoding set. Encoders take UTF-8 text and
// treat ill-formed input bytes as U+FFFD.

[[nodiscard]] Bytes encodeAscii(std::string_view text);      // > U+007F becomes '?'
[[nodiscard]] Bytes encodeUtf16Be(std::string_view text);
[[nodiscard]] Bytes encodeUtf16Le(std::string_view text);
[[nodiscard]] Bytes encodeUtf32Le(std::string_view text);

[[nodiscard]] TextResult decodeAscii(const Bytes& bytes);     // > 0x7F becomes '?', never fails
[[nodiscard]] TextResult decodeUtf16Be(const Bytes& bytes);
[[nodiscard]] TextResult decodeUtf16Le(const Bytes& bytes);
[[nodiscard]] TextResult decodeUtf32Le(const Bytes& bytes);

// Round trips through one encoding. Conforming input comes back unchanged; anything the
// encoding cannot represent is replaced following that encoder's loss policy.
[[nodiscard]] std::string toAscii(std::string_view text);
[[nodiscard]] std::string toUtf8(std::string_view text);
[[nodiscard]] std::string toUtf16(std::string_view text);   // UTF-16BE
[[nodiscard]] std::string toUnicode(std::string_view text); // UTF-16LE
[[nodiscard]] std::string toUtf32(std::string_view text);   // UTF-32LE

} // namespace codec
