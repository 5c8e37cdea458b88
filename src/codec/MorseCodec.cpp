#include "MorseCodec.hpp"
#include "MorseTable.hpp"
#include "unicode/CharClass.hpp"
#include "unicode/Utf8.hpp"

namespace codec
{

std::string toMorse(std::string_view text)
{
    const MorseTable& table = MorseTable::Instance();

    std::string out;
    for (char32_t cp : unicode::utf8ToUtf32(text))
    {
        const std::string* token = table.tokenFor(unicode::toUpper(cp));
        if (!token)
            continue;
        if (!out.empty())
            out.push_back(' ');
        out += *token;
    }
    return out;
}

std::string fromMorse(std::string_view morse)
{
    const MorseTable& table = MorseTable::Instance();

    std::string out;
    size_t start = 0;
    while (start <= morse.size())
    {
        size_t end = morse.find(' ', start);
        if (end == std::string_view::npos)
            end = morse.size();

        const char32_t symbol = table.symbolFor(morse.substr(start, end - start));
        if (symbol != U'\0')
            unicode::appendUtf8(out, symbol);

        start = end + 1;
    }
    return out;
}

} // namespace codec
