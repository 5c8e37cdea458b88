#pragma once

#include "CodecResult.hpp"
#include "GzipCodec.hpp"

#include <string>
#include <string_view>

namespace codec
{

struct CompressionOptions
{
    int level = kDefaultCompressionLevel;
};

/// UTF-16LE bytes of text, gzip-compressed, as padded base64
[[nodiscard]] TextResult compress(std::string_view text, const CompressionOptions& options = {});

/// Exact inverse of compress. Fails with InvalidBase64, CorruptStream or InvalidEncoding
/// depending on the stage that rejects the payload.
[[nodiscard]] TextResult decompress(std::string_view payload);

} // namespace codec
