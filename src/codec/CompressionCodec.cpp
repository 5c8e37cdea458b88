#include "CompressionCodec.hpp"
#include "Base64.hpp"
#include "ByteEncodings.hpp"
#include "utils/Diagnostics.hpp"

#include <plog/Log.h>

namespace codec
{

TextResult compress(std::string_view text, const CompressionOptions& options)
{
    const Bytes wide = encodeUtf16Le(text);
    BytesResult compressed = gzipCompress(wide, options.level);
    if (!compressed)
        return TextResult::failure(compressed);

    if (utils::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG << "compressed " << wide.size() << " UTF-16 bytes to " << compressed.value.size()
                   << " gzip bytes at level " << options.level;
    }
    return TextResult::success(base64Encode(compressed.value));
}

TextResult decompress(std::string_view payload)
{
    BytesResult raw = base64Decode(payload);
    if (!raw)
    {
        PLOG_WARNING << "decompress rejected payload (" << raw.error.value_or("") << "): "
                     << utils::Diagnostics::Preview(payload);
        return TextResult::failure(raw);
    }

    BytesResult inflated = gzipDecompress(raw.value);
    if (!inflated)
    {
        PLOG_WARNING << "decompress rejected gzip stream (" << inflated.error.value_or("") << "): "
                     << utils::Diagnostics::Preview(payload);
        return TextResult::failure(inflated);
    }

    TextResult text = decodeUtf16Le(inflated.value);
    if (!text)
    {
        PLOG_WARNING << "decompressed bytes are not UTF-16LE (" << text.error.value_or("") << ")";
    }
    return text;
}

} // namespace codec
