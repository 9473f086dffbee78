#pragma once

#include <tomato/core/types.hpp>

namespace tomato::core {

/// Pomodoro durations and cycle length. Fixed for the lifetime of a timer.
struct PomodoroConfig {
    static constexpr sint64 kDefaultFocusSeconds = 25 * 60;
    static constexpr sint64 kDefaultShortBreakSeconds = 5 * 60;
    static constexpr sint64 kDefaultLongBreakSeconds = 15 * 60;
    static constexpr uint32 kDefaultPomodorosBeforeLong = 4;

    static constexpr sint64 kMinPhaseSeconds = 1;
    static constexpr sint64 kMaxPhaseSeconds = 24 * 60 * 60;
    static constexpr uint32 kMinPomodorosBeforeLong = 1;
    static constexpr uint32 kMaxPomodorosBeforeLong = 16;

    sint64 focusSeconds = kDefaultFocusSeconds;
    sint64 shortBreakSeconds = kDefaultShortBreakSeconds;
    sint64 longBreakSeconds = kDefaultLongBreakSeconds;
    uint32 pomodorosBeforeLong = kDefaultPomodorosBeforeLong;

    // Returns a copy with every field clamped into its valid range.
    [[nodiscard]] PomodoroConfig Sanitized() const;

    bool operator==(const PomodoroConfig &) const = default;
};

} // namespace tomato::core
