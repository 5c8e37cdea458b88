#include "MorseTable.hpp"

#include <plog/Log.h>

#include <iterator>
#include <utility>

namespace codec
{

namespace
{

struct MorseEntry
{
    char32_t symbol;
    const char* token;
};

constexpr MorseEntry kAlphabet[] = {
    { U'A', ".-" },    { U'B', "-..." },  { U'C', "-.-." },  { U'D', "-.." },   { U'E', "." },
    { U'F', "..-." },  { U'G', "--." },   { U'H', "...." },  { U'I', ".." },    { U'J', ".---" },
    { U'K', "-.-" },   { U'L', ".-.." },  { U'M', "--" },    { U'N', "-." },    { U'O', "---" },
    { U'P', ".--." },  { U'Q', "--.-" },  { U'R', ".-." },   { U'S', "..." },   { U'T', "-" },
    { U'U', "..-" },   { U'V', "...-" },  { U'W', ".--" },   { U'X', "-..-" },  { U'Y', "-.--" },
    { U'Z', "--.." },  { U'1', ".----" }, { U'2', "..---" }, { U'3', "...--" }, { U'4', "....-" },
    { U'5', "....." }, { U'6', "-...." }, { U'7', "--..." }, { U'8', "---.." }, { U'9', "----." },
    { U'0', "-----" },
};

} // namespace

const MorseTable& MorseTable::Instance()
{
    static const MorseTable table;
    return table;
}

MorseTable::MorseTable()
{
    encode_.reserve(std::size(kAlphabet));
    decode_.reserve(std::size(kAlphabet));

    for (const auto& entry : kAlphabet)
    {
        encode_.emplace(entry.symbol, entry.token);
    }

    for (const auto& [symbol, token] : encode_)
    {
        auto [it, inserted] = decode_.emplace(token, symbol);
        if (!inserted)
        {
            PLOG_ERROR << "Morse token '" << token << "' is assigned to more than one symbol";
        }
    }

    PLOG_DEBUG << "Morse table initialized with " << encode_.size() << " symbols";
}

const std::string* MorseTable::tokenFor(char32_t symbol) const
{
    auto it = encode_.find(symbol);
    return it != encode_.end() ? &it->second : nullptr;
}

char32_t MorseTable::symbolFor(std::string_view token) const
{
    auto it = decode_.find(std::string(token));
    return it != decode_.end() ? it->second : U'\0';
}

} // namespace codec
