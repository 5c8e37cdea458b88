#include "Base64.hpp"

#include <array>

namespace codec
{

namespace
{

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int8_t, 256> buildReverseTable()
{
    std::array<int8_t, 256> table{};
    for (auto& entry : table)
        entry = -1;
    for (int i = 0; i < 64; ++i)
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    return table;
}

constexpr auto kReverse = buildReverseTable();

bool isSkippable(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

} // namespace

std::string base64Encode(const Bytes& bytes)
{
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3)
    {
        const uint32_t chunk = (static_cast<uint32_t>(bytes[i]) << 16) | (static_cast<uint32_t>(bytes[i + 1]) << 8)
                               | bytes[i + 2];
        out.push_back(kAlphabet[(chunk >> 18) & 0x3Fu]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3Fu]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3Fu]);
        out.push_back(kAlphabet[chunk & 0x3Fu]);
    }

    const size_t rest = bytes.size() - i;
    if (rest == 1)
    {
        const uint32_t chunk = static_cast<uint32_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3Fu]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3Fu]);
        out += "==";
    }
    else if (rest == 2)
    {
        const uint32_t chunk = (static_cast<uint32_t>(bytes[i]) << 16) | (static_cast<uint32_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3Fu]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3Fu]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3Fu]);
        out.push_back('=');
    }

    return out;
}

BytesResult base64Decode(std::string_view text)
{
    std::string compact;
    compact.reserve(text.size());
    for (char c : text)
    {
        if (!isSkippable(c))
            compact.push_back(c);
    }

    if (compact.size() % 4 != 0)
    {
        return BytesResult::failure(CodecError::InvalidBase64,
                                    "base64 length " + std::to_string(compact.size()) + " is not a multiple of 4");
    }

    Bytes out;
    out.reserve(compact.size() / 4 * 3);

    for (size_t i = 0; i < compact.size(); i += 4)
    {
        const bool last_quantum = i + 4 == compact.size();
        size_t padding = 0;
        uint32_t chunk = 0;

        for (size_t j = 0; j < 4; ++j)
        {
            const char c = compact[i + j];
            if (c == '=')
            {
                // padding only in the last two positions of the final quantum
                if (!last_quantum || j < 2)
                {
                    return BytesResult::failure(CodecError::InvalidBase64,
                                                "misplaced padding at offset " + std::to_string(i + j));
                }
                ++padding;
                chunk <<= 6;
                continue;
            }

            const int8_t value = kReverse[static_cast<unsigned char>(c)];
            if (value < 0 || padding > 0)
            {
                return BytesResult::failure(CodecError::InvalidBase64,
                                            "invalid base64 character at offset " + std::to_string(i + j));
            }
            chunk = (chunk << 6) | static_cast<uint32_t>(value);
        }

        out.push_back(static_cast<uint8_t>((chunk >> 16) & 0xFFu));
        if (padding < 2)
            out.push_back(static_cast<uint8_t>((chunk >> 8) & 0xFFu));
        if (padding < 1)
            out.push_back(static_cast<uint8_t>(chunk & 0xFFu));
    }

    return BytesResult::success(std::move(out));
}

} // namespace codec
