#include "ByteEncodings.hpp"
#include "unicode/Utf8.hpp"

#include <plog/Log.h>

namespace codec
{

namespace
{

enum class Endian
{
    Big,
    Little
};

void putUnit16(Bytes& out, uint16_t unit, Endian endian)
{
    const auto high = static_cast<uint8_t>(unit >> 8);
    const auto low = static_cast<uint8_t>(unit & 0xFFu);
    if (endian == Endian::Big)
    {
        out.push_back(high);
        out.push_back(low);
    }
    else
    {
        out.push_back(low);
        out.push_back(high);
    }
}

Bytes encodeUtf16(std::string_view text, Endian endian)
{
    Bytes out;
    out.reserve(text.size() * 2);
    for (char32_t cp : unicode::utf8ToUtf32(text))
    {
        if (cp >= 0x10000u)
        {
            const uint32_t v = static_cast<uint32_t>(cp) - 0x10000u;
            putUnit16(out, static_cast<uint16_t>(0xD800u + (v >> 10)), endian);
            putUnit16(out, static_cast<uint16_t>(0xDC00u + (v & 0x3FFu)), endian);
        }
        else
        {
            putUnit16(out, static_cast<uint16_t>(cp), endian);
        }
    }
    return out;
}

TextResult decodeUtf16(const Bytes& bytes, Endian endian)
{
    if (bytes.size() % 2 != 0)
    {
        return TextResult::failure(CodecError::InvalidEncoding,
                                   "UTF-16 byte count " + std::to_string(bytes.size()) + " is odd");
    }

    auto unitAt = [&](size_t i) -> uint16_t
    {
        const uint16_t first = bytes[i];
        const uint16_t second = bytes[i + 1];
        return endian == Endian::Big ? static_cast<uint16_t>((first << 8) | second)
                                     : static_cast<uint16_t>((second << 8) | first);
    };

    std::string out;
    out.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size(); i += 2)
    {
        const uint16_t unit = unitAt(i);
        if (unit >= 0xD800u && unit <= 0xDBFFu)
        {
            if (i + 3 >= bytes.size())
            {
                return TextResult::failure(CodecError::InvalidEncoding,
                                           "unpaired high surrogate at byte " + std::to_string(i));
            }
            const uint16_t trail = unitAt(i + 2);
            if (trail < 0xDC00u || trail > 0xDFFFu)
            {
                return TextResult::failure(CodecError::InvalidEncoding,
                                           "unpaired high surrogate at byte " + std::to_string(i));
            }
            const char32_t cp = 0x10000u + ((static_cast<char32_t>(unit) - 0xD800u) << 10)
                                + (static_cast<char32_t>(trail) - 0xDC00u);
            unicode::appendUtf8(out, cp);
            i += 2;
        }
        else if (unit >= 0xDC00u && unit <= 0xDFFFu)
        {
            return TextResult::failure(CodecError::InvalidEncoding,
                                       "unpaired low surrogate at byte " + std::to_string(i));
        }
        else
        {
            unicode::appendUtf8(out, unit);
        }
    }
    return TextResult::success(std::move(out));
}

std::string unwrapRoundTrip(const TextResult& result, const char* encoding)
{
    if (!result)
    {
        // Unreachable: encoders map ill-formed input to U+FFFD and only emit well-formed units
        PLOG_ERROR << encoding << " round trip failed: " << result.error.value_or("unknown");
        return std::string();
    }
    return result.value;
}

} // namespace

Bytes encodeAscii(std::string_view text)
{
    Bytes out;
    out.reserve(text.size());
    for (char32_t cp : unicode::utf8ToUtf32(text))
    {
        out.push_back(cp <= 0x7Fu ? static_cast<uint8_t>(cp) : static_cast<uint8_t>('?'));
    }
    return out;
}

Bytes encodeUtf16Be(std::string_view text) { return encodeUtf16(text, Endian::Big); }

Bytes encodeUtf16Le(std::string_view text) { return encodeUtf16(text, Endian::Little); }

Bytes encodeUtf32Le(std::string_view text)
{
    Bytes out;
    out.reserve(text.size() * 4);
    for (char32_t cp : unicode::utf8ToUtf32(text))
    {
        const auto v = static_cast<uint32_t>(cp);
        out.push_back(static_cast<uint8_t>(v & 0xFFu));
        out.push_back(static_cast<uint8_t>((v >> 8) & 0xFFu));
        out.push_back(static_cast<uint8_t>((v >> 16) & 0xFFu));
        out.push_back(static_cast<uint8_t>((v >> 24) & 0xFFu));
    }
    return out;
}

TextResult decodeAscii(const Bytes& bytes)
{
    std::string out;
    out.reserve(bytes.size());
    for (uint8_t b : bytes)
    {
        out.push_back(b <= 0x7Fu ? static_cast<char>(b) : '?');
    }
    return TextResult::success(std::move(out));
}

TextResult decodeUtf16Be(const Bytes& bytes) { return decodeUtf16(bytes, Endian::Big); }

TextResult decodeUtf16Le(const Bytes& bytes) { return decodeUtf16(bytes, Endian::Little); }

TextResult decodeUtf32Le(const Bytes& bytes)
{
    if (bytes.size() % 4 != 0)
    {
        return TextResult::failure(CodecError::InvalidEncoding,
                                   "UTF-32 byte count " + std::to_string(bytes.size()) + " is not a multiple of 4");
    }

    std::string out;
    out.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size(); i += 4)
    {
        const uint32_t v = static_cast<uint32_t>(bytes[i]) | (static_cast<uint32_t>(bytes[i + 1]) << 8)
                           | (static_cast<uint32_t>(bytes[i + 2]) << 16) | (static_cast<uint32_t>(bytes[i + 3]) << 24);
        if (v > 0x10FFFFu || unicode::isSurrogate(v))
        {
            return TextResult::failure(CodecError::InvalidEncoding,
                                       "invalid UTF-32 scalar value at byte " + std::to_string(i));
        }
        unicode::appendUtf8(out, static_cast<char32_t>(v));
    }
    return TextResult::success(std::move(out));
}

std::string toAscii(std::string_view text)
{
    return unwrapRoundTrip(decodeAscii(encodeAscii(text)), "ASCII");
}

std::string toUtf8(std::string_view text)
{
    return unicode::utf32ToUtf8(unicode::utf8ToUtf32(text));
}

std::string toUtf16(std::string_view text)
{
    return unwrapRoundTrip(decodeUtf16Be(encodeUtf16Be(text)), "UTF-16BE");
}

std::string toUnicode(std::string_view text)
{
    return unwrapRoundTrip(decodeUtf16Le(encodeUtf16Le(text)), "UTF-16LE");
}

std::string toUtf32(std::string_view text)
{
    return unwrapRoundTrip(decodeUtf32Le(encodeUtf32Le(text)), "UTF-32LE");
}

} // namespace codec
