#include <tomato/timer/timer_defs.hpp>

using namespace std::literals;

namespace tomato::timer {

std::string_view ToString(Phase phase) {
    switch (phase) {
    case Phase::Focus: return "Focus";
    case Phase::ShortBreak: return "ShortBreak";
    case Phase::LongBreak: return "LongBreak";
    }
    return "Focus";
}

std::string_view ToString(TimerState state) {
    switch (state) {
    case TimerState::Idle: return "Idle";
    case TimerState::Running: return "Running";
    case TimerState::Paused: return "Paused";
    }
    return "Idle";
}

bool TryParse(std::string_view name, Phase &value) {
    if (name == "Focus"sv) {
        value = Phase::Focus;
    } else if (name == "ShortBreak"sv) {
        value = Phase::ShortBreak;
    } else if (name == "LongBreak"sv) {
        value = Phase::LongBreak;
    } else {
        return false;
    }
    return true;
}

bool TryParse(std::string_view name, TimerState &value) {
    if (name == "Idle"sv) {
        value = TimerState::Idle;
    } else if (name == "Running"sv) {
        value = TimerState::Running;
    } else if (name == "Paused"sv) {
        value = TimerState::Paused;
    } else {
        return false;
    }
    return true;
}

} // namespace tomato::timer
