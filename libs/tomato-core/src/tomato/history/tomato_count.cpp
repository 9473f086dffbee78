#include <tomato/history/tomato_count.hpp>

#include <algorithm>
#include <string>
#include <unordered_map>

namespace tomato::history {

namespace {

    // Ascending completion order; equal timestamps fall back to insertion order
    bool CompletedBefore(const FocusRecord &lhs, const FocusRecord &rhs) {
        if (lhs.completedAt != rhs.completedAt) {
            return lhs.completedAt < rhs.completedAt;
        }
        return lhs.id < rhs.id;
    }

} // namespace

std::vector<TomatoCountEntry> ComputeTomatoCounts(std::span<const FocusRecord> records) {
    std::vector<TomatoCountEntry> entries{};
    entries.reserve(records.size());
    for (const FocusRecord &record : records) {
        entries.push_back({.record = record});
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const TomatoCountEntry &lhs, const TomatoCountEntry &rhs) {
                         return CompletedBefore(lhs.record, rhs.record);
                     });

    std::unordered_map<std::string, uint32> totals{};
    for (TomatoCountEntry &entry : entries) {
        uint32 &total = totals[entry.record.task];
        total += std::max<uint32>(1, entry.record.completedPomodoros);
        entry.cumulativeTomatoes = total;
    }

    std::reverse(entries.begin(), entries.end());
    return entries;
}

} // namespace tomato::history
