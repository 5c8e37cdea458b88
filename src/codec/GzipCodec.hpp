#pragma once

#include "CodecResult.hpp"

namespace codec
{

constexpr int kDefaultCompressionLevel = 6;

/// Single gzip member (RFC 1952) around a raw DEFLATE stream produced by miniz.
/// level is a miniz level, 0 (store) to 10 (uber).
[[nodiscard]] BytesResult gzipCompress(const Bytes& input, int level = kDefaultCompressionLevel);

/// Validates the gzip header, inflates, and checks CRC-32 and ISIZE.
/// Trailing bytes after the member are rejected.
[[nodiscard]] BytesResult gzipDecompress(const Bytes& input);

} // namespace codec
