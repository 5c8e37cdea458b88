#pragma once

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace metrics
{

// Occurrence counts that remember the order in which keys were first seen.
// Built per call; the ordering is what makes the most/least frequent tie-break
// deterministic (earliest first-seen key wins among equal counts).
template <typename Key, typename Hash = std::hash<Key>>
class FrequencyTable
{
public:
    struct Entry
    {
        Key key;
        std::size_t count;
    };

    void add(const Key& key)
    {
        auto [it, inserted] = index_.try_emplace(key, entries_.size());
        if (inserted)
        {
            entries_.push_back({ key, 1 });
        }
        else
        {
            ++entries_[it->second].count;
        }
    }

    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] std::size_t distinct() const { return entries_.size(); }

    [[nodiscard]] std::size_t countOf(const Key& key) const
    {
        auto it = index_.find(key);
        return it != index_.end() ? entries_[it->second].count : 0;
    }

    // Entries in first-seen order
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

    // Highest count, earliest first-seen on ties. nullptr when empty.
    [[nodiscard]] const Entry* mostFrequent() const
    {
        return pick([](std::size_t candidate, std::size_t best) { return candidate > best; });
    }

    // Lowest count, earliest first-seen on ties. nullptr when empty.
    [[nodiscard]] const Entry* leastFrequent() const
    {
        return pick([](std::size_t candidate, std::size_t best) { return candidate < best; });
    }

private:
    template <typename Better>
    const Entry* pick(Better better) const
    {
        const Entry* best = nullptr;
        for (const auto& entry : entries_)
        {
            // strict comparison keeps the earlier entry on ties
            if (!best || better(entry.count, best->count))
                best = &entry;
        }
        return best;
    }

    std::vector<Entry> entries_;
    std::unordered_map<Key, std::size_t, Hash> index_;
};

} // namespace metrics
