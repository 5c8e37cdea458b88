#include "Escaping.hpp"
#include "unicode/Utf8.hpp"

#include <cstdio>

namespace transform
{

namespace
{

void appendUnitEscape(std::string& out, uint32_t unit)
{
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "\\u%04X", static_cast<unsigned>(unit));
    out += buffer;
}

} // namespace

std::string toJsonEscaped(std::string_view text)
{
    if (text.empty())
        return std::string();

    std::string out;
    out.reserve(text.size() + text.size() / 4);
    for (char32_t cp : unicode::utf8ToUtf32(text))
    {
        switch (cp)
        {
        case U'"':
            out += "\\\"";
            break;
        case U'\\':
            out += "\\\\";
            break;
        case U'\b':
            out += "\\b";
            break;
        case U'\f':
            out += "\\f";
            break;
        case U'\n':
            out += "\\n";
            break;
        case U'\r':
            out += "\\r";
            break;
        case U'\t':
            out += "\\t";
            break;
        default:
            if (cp >= 0x10000u)
            {
                const uint32_t v = static_cast<uint32_t>(cp) - 0x10000u;
                appendUnitEscape(out, 0xD800u + (v >> 10));
                appendUnitEscape(out, 0xDC00u + (v & 0x3FFu));
            }
            else if (cp < 0x20u || cp > 0x7Fu)
            {
                appendUnitEscape(out, static_cast<uint32_t>(cp));
            }
            else
            {
                out.push_back(static_cast<char>(cp));
            }
            break;
        }
    }
    return out;
}

std::string toXmlEscaped(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
        case '&':
            out += "&amp;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

} // namespace transform
