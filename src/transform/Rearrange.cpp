#include "Rearrange.hpp"
#include "unicode/Graphemes.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace transform
{

namespace
{

std::string join(const std::vector<std::string>& clusters, size_t reserve)
{
    std::string out;
    out.reserve(reserve);
    for (const auto& cluster : clusters)
        out += cluster;
    return out;
}

} // namespace

std::string reverse(std::string_view text)
{
    std::vector<std::string> clusters = unicode::splitGraphemes(text);
    std::reverse(clusters.begin(), clusters.end());
    return join(clusters, text.size());
}

std::string shuffle(std::string_view text, std::mt19937& rng)
{
    std::vector<std::string> clusters = unicode::splitGraphemes(text);
    for (size_t i = clusters.size(); i > 1; --i)
    {
        std::uniform_int_distribution<size_t> pick(0, i - 1);
        std::swap(clusters[i - 1], clusters[pick(rng)]);
    }
    return join(clusters, text.size());
}

} // namespace transform
