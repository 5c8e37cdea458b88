#include "BinaryCodec.hpp"
#include "unicode/Utf8.hpp"
#include "utils/Diagnostics.hpp"

#include <plog/Log.h>

namespace codec
{

namespace
{

constexpr size_t kTokenWidth = 8;

std::string toBase2(uint32_t value)
{
    std::string digits;
    while (value != 0)
    {
        digits.insert(digits.begin(), static_cast<char>('0' + (value & 1u)));
        value >>= 1;
    }
    if (digits.size() < kTokenWidth)
        digits.insert(0, kTokenWidth - digits.size(), '0');
    return digits;
}

} // namespace

std::string toBinary(std::string_view text)
{
    const std::u32string code_points = unicode::utf8ToUtf32(text);

    std::string out;
    out.reserve(code_points.size() * (kTokenWidth + 1));
    for (size_t i = 0; i < code_points.size(); ++i)
    {
        if (i > 0)
            out.push_back(' ');
        out += toBase2(static_cast<uint32_t>(code_points[i]));
    }
    return out;
}

TextResult fromBinary(std::string_view binary)
{
    if (binary.empty())
        return TextResult::success(std::string());

    std::string out;
    out.reserve(binary.size() / (kTokenWidth + 1) + 1);

    size_t token_index = 0;
    size_t start = 0;
    while (start <= binary.size())
    {
        size_t end = binary.find(' ', start);
        if (end == std::string_view::npos)
            end = binary.size();

        const std::string_view token = binary.substr(start, end - start);
        unsigned value = 0;
        bool valid = token.size() == kTokenWidth;
        for (char c : token)
        {
            if (c != '0' && c != '1')
            {
                valid = false;
                break;
            }
            value = (value << 1) | static_cast<unsigned>(c - '0');
        }

        if (!valid)
        {
            PLOG_WARNING << "binary decode rejected token " << token_index << ": "
                         << utils::Diagnostics::Preview(binary);
            return TextResult::failure(CodecError::InvalidToken,
                                       "token " + std::to_string(token_index) + " is not an 8-bit binary literal");
        }

        // ASCII decoding narrows anything past 0x7F
        out.push_back(value <= 0x7Fu ? static_cast<char>(value) : '?');

        ++token_index;
        start = end + 1;
    }

    return TextResult::success(std::move(out));
}

} // namespace codec
