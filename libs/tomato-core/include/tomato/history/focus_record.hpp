#pragma once

#include <tomato/core/types.hpp>

#include <string>

namespace tomato::history {

/// One completed focus phase.
struct FocusRecord {
    sint64 id = 0; // assigned by the store; 0 until persisted
    std::string task;
    sint64 durationSeconds = 0;
    std::string completedAt; // ISO-8601, +08:00 offset
    uint32 completedPomodoros = 0;

    bool operator==(const FocusRecord &) const = default;
};

} // namespace tomato::history
