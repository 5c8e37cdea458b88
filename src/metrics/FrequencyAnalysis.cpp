#include "FrequencyAnalysis.hpp"
#include "FrequencyTable.hpp"
#include "Segmentation.hpp"
#include "unicode/CharClass.hpp"
#include "unicode/Utf8.hpp"

namespace metrics
{

namespace
{

FrequencyTable<char32_t> characterTable(std::string_view text)
{
    FrequencyTable<char32_t> table;
    for (char32_t cp : unicode::utf8ToUtf32(text))
    {
        if (unicode::isLetterOrDigit(cp))
            table.add(cp);
    }
    return table;
}

FrequencyTable<std::string_view> wordTable(std::string_view text)
{
    FrequencyTable<std::string_view> table;
    for (std::string_view token : splitWordTokens(text))
        table.add(token);
    return table;
}

std::string characterKey(const FrequencyTable<char32_t>::Entry* entry)
{
    std::string out;
    if (entry)
        unicode::appendUtf8(out, entry->key);
    return out;
}

std::string wordKey(const FrequencyTable<std::string_view>::Entry* entry)
{
    return entry ? std::string(entry->key) : std::string();
}

} // namespace

std::string mostFrequentCharacter(std::string_view text)
{
    return characterKey(characterTable(text).mostFrequent());
}

std::string leastFrequentCharacter(std::string_view text)
{
    return characterKey(characterTable(text).leastFrequent());
}

std::string mostFrequentWord(std::string_view text)
{
    return wordKey(wordTable(text).mostFrequent());
}

std::string leastFrequentWord(std::string_view text)
{
    return wordKey(wordTable(text).leastFrequent());
}

} // namespace metrics
