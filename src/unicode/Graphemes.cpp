#include "Graphemes.hpp"
#include "Utf8.hpp"

#include <plog/Log.h>
#include <utf8proc.h>

#include <cstdlib>

namespace unicode
{

namespace
{

// Walks text and calls on_cluster(begin, end) with byte offsets of each cluster.
template <typename Callback>
void forEachGrapheme(std::string_view text, Callback&& on_cluster)
{
    size_t cluster_start = 0;
    size_t index = 0;
    utf8proc_int32_t previous = -1;
    utf8proc_int32_t state = 0;

    while (index < text.size())
    {
        const size_t offset = index;
        uint32_t codepoint = 0;
        if (!decodeNextUtf8(text, index, codepoint))
            codepoint = kReplacementChar;

        const auto current = static_cast<utf8proc_int32_t>(codepoint);
        if (previous >= 0 && utf8proc_grapheme_break_stateful(previous, current, &state))
        {
            on_cluster(cluster_start, offset);
            cluster_start = offset;
        }
        previous = current;
    }

    if (previous >= 0)
        on_cluster(cluster_start, text.size());
}

} // namespace

std::vector<std::string> splitGraphemes(std::string_view text)
{
    std::vector<std::string> clusters;
    forEachGrapheme(text, [&](size_t begin, size_t end)
    {
        clusters.emplace_back(text.substr(begin, end - begin));
    });
    return clusters;
}

std::size_t countGraphemes(std::string_view text)
{
    std::size_t count = 0;
    forEachGrapheme(text, [&](size_t, size_t) { ++count; });
    return count;
}

std::string normalizeNfc(const std::string& text)
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* normalized = utf8proc_NFC(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));
    if (!normalized)
    {
        PLOG_WARNING << "NFC normalization failed, keeping input as-is";
        return text;
    }

    std::string result(reinterpret_cast<char*>(normalized));
    std::free(normalized);
    return result;
}

} // namespace unicode
