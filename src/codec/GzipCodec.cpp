#include "GzipCodec.hpp"

#include <plog/Log.h>
#include <miniz.h>

#include <algorithm>
#include <array>
#include <initializer_list>

namespace codec
{

namespace
{

constexpr uint8_t kGzipId1 = 0x1F;
constexpr uint8_t kGzipId2 = 0x8B;
constexpr uint8_t kMethodDeflate = 8;
constexpr uint8_t kOsUnknown = 0xFF;
constexpr size_t kHeaderSize = 10;
constexpr size_t kTrailerSize = 8;

enum GzipFlags : uint8_t
{
    FTEXT = 0x01,
    FHCRC = 0x02,
    FEXTRA = 0x04,
    FNAME = 0x08,
    FCOMMENT = 0x10,
    FRESERVED = 0xE0
};

void putLe32(Bytes& out, uint32_t value)
{
    for (int shift = 0; shift < 32; shift += 8)
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFFu));
}

uint32_t readLe32(const Bytes& in, size_t offset)
{
    return static_cast<uint32_t>(in[offset]) | (static_cast<uint32_t>(in[offset + 1]) << 8)
           | (static_cast<uint32_t>(in[offset + 2]) << 16) | (static_cast<uint32_t>(in[offset + 3]) << 24);
}

uint32_t crc32Of(const Bytes& data)
{
    return static_cast<uint32_t>(mz_crc32(MZ_CRC32_INIT, data.data(), data.size()));
}

// Returns the offset of the DEFLATE payload, or 0 when the header is malformed.
size_t parseHeader(const Bytes& in, std::string& outError)
{
    if (in.size() < kHeaderSize + kTrailerSize)
    {
        outError = "gzip stream is truncated (" + std::to_string(in.size()) + " bytes)";
        return 0;
    }
    if (in[0] != kGzipId1 || in[1] != kGzipId2)
    {
        outError = "missing gzip magic bytes";
        return 0;
    }
    if (in[2] != kMethodDeflate)
    {
        outError = "unsupported gzip compression method " + std::to_string(in[2]);
        return 0;
    }

    const uint8_t flags = in[3];
    if (flags & FRESERVED)
    {
        outError = "reserved gzip flag bits are set";
        return 0;
    }

    size_t offset = kHeaderSize;
    if (flags & FEXTRA)
    {
        if (offset + 2 > in.size())
        {
            outError = "gzip extra field is truncated";
            return 0;
        }
        const size_t extra_len = static_cast<size_t>(in[offset]) | (static_cast<size_t>(in[offset + 1]) << 8);
        offset += 2 + extra_len;
    }

    for (uint8_t field : { FNAME, FCOMMENT })
    {
        if (!(flags & field))
            continue;
        while (offset < in.size() && in[offset] != 0)
            ++offset;
        ++offset; // terminating zero
    }

    if (flags & FHCRC)
        offset += 2;

    if (offset + kTrailerSize > in.size())
    {
        outError = "gzip header runs past the end of the stream";
        return 0;
    }
    return offset;
}

} // namespace

BytesResult gzipCompress(const Bytes& input, int level)
{
    level = std::clamp(level, 0, 10);

    mz_stream stream{};
    if (mz_deflateInit2(&stream, level, MZ_DEFLATED, -MZ_DEFAULT_WINDOW_BITS, 9, MZ_DEFAULT_STRATEGY) != MZ_OK)
    {
        PLOG_ERROR << "mz_deflateInit2 failed for level " << level;
        return BytesResult::failure(CodecError::CompressorFailure, "failed to initialize DEFLATE compressor");
    }

    Bytes out = { kGzipId1, kGzipId2, kMethodDeflate, 0, 0, 0, 0, 0, 0, kOsUnknown };

    std::array<unsigned char, 16384> chunk{};
    stream.next_in = input.data();
    stream.avail_in = static_cast<unsigned int>(input.size());

    int status = MZ_OK;
    do
    {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<unsigned int>(chunk.size());
        status = mz_deflate(&stream, MZ_FINISH);
        if (status != MZ_OK && status != MZ_STREAM_END)
        {
            PLOG_ERROR << "mz_deflate failed: " << mz_error(status);
            mz_deflateEnd(&stream);
            return BytesResult::failure(CodecError::CompressorFailure, "DEFLATE compression failed");
        }
        out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - stream.avail_out));
    } while (status != MZ_STREAM_END);

    mz_deflateEnd(&stream);

    putLe32(out, crc32Of(input));
    putLe32(out, static_cast<uint32_t>(input.size() & 0xFFFFFFFFu));
    return BytesResult::success(std::move(out));
}

BytesResult gzipDecompress(const Bytes& input)
{
    std::string error;
    const size_t payload = parseHeader(input, error);
    if (payload == 0)
        return BytesResult::failure(CodecError::CorruptStream, error);

    mz_stream stream{};
    if (mz_inflateInit2(&stream, -MZ_DEFAULT_WINDOW_BITS) != MZ_OK)
    {
        PLOG_ERROR << "mz_inflateInit2 failed";
        return BytesResult::failure(CodecError::CompressorFailure, "failed to initialize DEFLATE decompressor");
    }

    const size_t deflate_size = input.size() - payload - kTrailerSize;
    stream.next_in = input.data() + payload;
    stream.avail_in = static_cast<unsigned int>(deflate_size);

    Bytes out;
    std::array<unsigned char, 16384> chunk{};
    int status = MZ_OK;
    do
    {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<unsigned int>(chunk.size());
        status = mz_inflate(&stream, MZ_NO_FLUSH);
        if (status != MZ_OK && status != MZ_STREAM_END)
        {
            mz_inflateEnd(&stream);
            return BytesResult::failure(CodecError::CorruptStream,
                                        std::string("DEFLATE data is corrupt: ") + mz_error(status));
        }
        const size_t produced = chunk.size() - stream.avail_out;
        out.insert(out.end(), chunk.data(), chunk.data() + produced);
        if (status == MZ_OK && produced == 0 && stream.avail_in == 0)
        {
            mz_inflateEnd(&stream);
            return BytesResult::failure(CodecError::CorruptStream, "DEFLATE data ends before the final block");
        }
    } while (status != MZ_STREAM_END);

    const size_t consumed = static_cast<size_t>(stream.total_in);
    mz_inflateEnd(&stream);

    if (consumed != deflate_size)
    {
        return BytesResult::failure(CodecError::CorruptStream,
                                    "unexpected " + std::to_string(deflate_size - consumed)
                                        + " bytes between DEFLATE data and gzip trailer");
    }

    const size_t trailer = input.size() - kTrailerSize;
    if (readLe32(input, trailer) != crc32Of(out))
        return BytesResult::failure(CodecError::CorruptStream, "gzip CRC-32 mismatch");
    if (readLe32(input, trailer + 4) != static_cast<uint32_t>(out.size() & 0xFFFFFFFFu))
        return BytesResult::failure(CodecError::CorruptStream, "gzip ISIZE mismatch");

    return BytesResult::success(std::move(out));
}

} // namespace codec
