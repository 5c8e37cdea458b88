#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace codec
{

// Immutable A-Z / 0-9 Morse alphabet. Only the symbol -> token direction is authored;
// the token -> symbol map is derived from it at construction, so the two can never
// disagree. Safe for concurrent reads.
class MorseTable
{
public:
    static const MorseTable& Instance();

    // Token for an upper-case symbol, or nullptr when the symbol is not in the alphabet
    [[nodiscard]] const std::string* tokenFor(char32_t symbol) const;

    // Symbol for a dot/dash token, or U'\0' when the token is unknown
    [[nodiscard]] char32_t symbolFor(std::string_view token) const;

    [[nodiscard]] size_t size() const { return encode_.size(); }

private:
    MorseTable();

    std::unordered_map<char32_t, std::string> encode_;
    std::unordered_map<std::string, char32_t> decode_;
};

} // namespace codec
