#include "Utf8.hpp"
#include <utf8proc.h>

namespace unicode
{

namespace
{

// A sequence cut short by the end of input: the lead byte and the continuation bytes
// that follow it decode as one U+FFFD, and the next byte starts a new sequence.
size_t truncatedLength(std::string_view text, size_t index)
{
    size_t length = 1;
    while (index + length < text.size() && (static_cast<unsigned char>(text[index + length]) & 0xC0u) == 0x80u)
        ++length;
    return length;
}

} // namespace

bool decodeNextUtf8(std::string_view text, size_t& index, uint32_t& codepoint)
{
    const unsigned char lead = static_cast<unsigned char>(text[index]);

    if (lead < 0x80u)
    {
        codepoint = lead;
        ++index;
        return true;
    }

    size_t remaining = text.size() - index;
    if (lead < 0xC2u)
    {
        ++index;
        return false;
    }

    if (lead < 0xE0u)
    {
        if (remaining < 2) { index += truncatedLength(text, index); return false; }
        unsigned char c1 = static_cast<unsigned char>(text[index + 1]);
        if ((c1 & 0xC0u) != 0x80u) { index += 1; return false; }
        codepoint = ((lead & 0x1Fu) << 6) | (c1 & 0x3Fu);
        index += 2;
        return true;
    }

    if (lead < 0xF0u)
    {
        if (remaining < 3) { index += truncatedLength(text, index); return false; }
        unsigned char c1 = static_cast<unsigned char>(text[index + 1]);
        unsigned char c2 = static_cast<unsigned char>(text[index + 2]);
        if ((c1 & 0xC0u) != 0x80u || (c2 & 0xC0u) != 0x80u)
        {
            index += 1;
            return false;
        }
        // overlong and surrogate ranges
        if ((lead == 0xE0u && c1 < 0xA0u) || (lead == 0xEDu && c1 >= 0xA0u))
        {
            index += 1;
            return false;
        }
        codepoint = ((lead & 0x0Fu) << 12) | ((c1 & 0x3Fu) << 6) | (c2 & 0x3Fu);
        index += 3;
        return true;
    }

    if (lead < 0xF5u)
    {
        if (remaining < 4) { index += truncatedLength(text, index); return false; }
        unsigned char c1 = static_cast<unsigned char>(text[index + 1]);
        unsigned char c2 = static_cast<unsigned char>(text[index + 2]);
        unsigned char c3 = static_cast<unsigned char>(text[index + 3]);
        if ((c1 & 0xC0u) != 0x80u || (c2 & 0xC0u) != 0x80u || (c3 & 0xC0u) != 0x80u)
        {
            index += 1;
            return false;
        }
        if ((lead == 0xF0u && c1 < 0x90u) || (lead == 0xF4u && c1 >= 0x90u))
        {
            index += 1;
            return false;
        }
        codepoint = ((lead & 0x07u) << 18) | ((c1 & 0x3Fu) << 12) | ((c2 & 0x3Fu) << 6) | (c3 & 0x3Fu);
        index += 4;
        return true;
    }

    ++index;
    return false;
}

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());
    size_t index = 0;
    while (index < utf8_str.size())
    {
        uint32_t codepoint = 0;
        if (decodeNextUtf8(utf8_str, index, codepoint))
        {
            result.push_back(static_cast<char32_t>(codepoint));
        }
        else
        {
            result.push_back(kReplacementChar);
        }
    }
    return result;
}

void appendUtf8(std::string& out, char32_t cp)
{
    utf8proc_uint8_t buffer[4];
    utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
    if (bytes > 0)
    {
        out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
    }
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        if (isSurrogate(cp) || !utf8proc_codepoint_valid(static_cast<utf8proc_int32_t>(cp)))
            continue;
        appendUtf8(result, cp);
    }
    return result;
}

bool isValidUtf8(std::string_view text)
{
    size_t index = 0;
    while (index < text.size())
    {
        uint32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
            return false;
    }
    return true;
}

} // namespace unicode
