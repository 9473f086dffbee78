#pragma once

#include "focus_record.hpp"

#include <span>
#include <vector>

namespace tomato::history {

struct TomatoCountEntry {
    FocusRecord record;
    uint32 cumulativeTomatoes = 0; // running per-task total up to and including this record
};

// Computes per-task cumulative tomato counts.
//
// Records are grouped by exact task text. Within a group the running total is accumulated in completion order
// (oldest first, ties broken by id), each record adding max(1, completedPomodoros). The result is returned newest
// first. Input order does not matter.
std::vector<TomatoCountEntry> ComputeTomatoCounts(std::span<const FocusRecord> records);

} // namespace tomato::history
