#include "HexCodec.hpp"
#include "unicode/Utf8.hpp"
#include "utils/Diagnostics.hpp"

#include <plog/Log.h>

namespace codec
{

namespace
{

constexpr char kHexDigits[] = "0123456789ABCDEF";

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

} // namespace

std::string toHex(std::string_view text)
{
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text)
    {
        const auto byte = static_cast<unsigned char>(c);
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0Fu]);
    }
    return out;
}

TextResult fromHex(std::string_view hex)
{
    if (hex.size() % 2 != 0)
    {
        PLOG_WARNING << "hex decode rejected odd-length input: " << utils::Diagnostics::Preview(hex);
        return TextResult::failure(CodecError::OddLength,
                                   "hex input has odd length " + std::to_string(hex.size()));
    }

    std::string bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        const int high = hexValue(hex[i]);
        const int low = hexValue(hex[i + 1]);
        if (high < 0 || low < 0)
        {
            const size_t bad = high < 0 ? i : i + 1;
            PLOG_WARNING << "hex decode rejected non-hex character at offset " << bad << ": "
                         << utils::Diagnostics::Preview(hex);
            return TextResult::failure(CodecError::InvalidDigit,
                                       "invalid hex digit at offset " + std::to_string(bad));
        }
        bytes.push_back(static_cast<char>((high << 4) | low));
    }

    if (!unicode::isValidUtf8(bytes))
    {
        PLOG_WARNING << "hex decode produced bytes that are not UTF-8: " << utils::Diagnostics::Preview(hex);
        return TextResult::failure(CodecError::InvalidEncoding, "decoded bytes are not valid UTF-8");
    }

    return TextResult::success(std::move(bytes));
}

} // namespace codec
