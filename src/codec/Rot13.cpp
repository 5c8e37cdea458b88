#include "Rot13.hpp"

namespace codec
{

namespace
{

char rotate(char c)
{
    if (c >= 'a' && c <= 'z')
        return static_cast<char>('a' + (c - 'a' + 13) % 26);
    if (c >= 'A' && c <= 'Z')
        return static_cast<char>('A' + (c - 'A' + 13) % 26);
    return c;
}

} // namespace

std::string rot13(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
        out.push_back(rotate(c));
    return out;
}

} // namespace codec
