#include <tomato/core/configuration.hpp>

#include <algorithm>

namespace tomato::core {

PomodoroConfig PomodoroConfig::Sanitized() const {
    PomodoroConfig out{};
    out.focusSeconds = std::clamp(focusSeconds, kMinPhaseSeconds, kMaxPhaseSeconds);
    out.shortBreakSeconds = std::clamp(shortBreakSeconds, kMinPhaseSeconds, kMaxPhaseSeconds);
    out.longBreakSeconds = std::clamp(longBreakSeconds, kMinPhaseSeconds, kMaxPhaseSeconds);
    out.pomodorosBeforeLong = std::clamp(pomodorosBeforeLong, kMinPomodorosBeforeLong, kMaxPomodorosBeforeLong);
    return out;
}

} // namespace tomato::core
