#pragma once

#include <tomato/timer/timer_defs.hpp>

#include <tomato/core/types.hpp>

#include <string>

namespace tomato::session {

/// Session state persisted between runs.
struct SessionSnapshot {
    std::string task;
    timer::Phase phase = timer::Phase::Focus;
    timer::TimerState state = timer::TimerState::Idle;
    sint64 remainingSeconds = 0;
    sint64 phaseTotalSeconds = 0;
    uint32 completedPomodoros = 0;

    bool operator==(const SessionSnapshot &) const = default;
};

} // namespace tomato::session
