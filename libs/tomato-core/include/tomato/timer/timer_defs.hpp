#pragma once

#include <tomato/core/types.hpp>

#include <chrono>
#include <string_view>

namespace tomato::timer {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Phase : uint8 {
    Focus,
    ShortBreak,
    LongBreak,
};

enum class TimerState : uint8 {
    Idle,
    Running,
    Paused,
};

std::string_view ToString(Phase phase);
std::string_view ToString(TimerState state);

// Leaves value untouched and returns false if name is not recognized.
bool TryParse(std::string_view name, Phase &value);
bool TryParse(std::string_view name, TimerState &value);

} // namespace tomato::timer
