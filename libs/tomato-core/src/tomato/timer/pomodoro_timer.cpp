#include <tomato/timer/pomodoro_timer.hpp>

#include <tomato/util/dev_log.hpp>

#include <algorithm>
#include <utility>

namespace tomato::timer {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // timer

    struct timer {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Timer";
    };

} // namespace grp

PomodoroTimer::PomodoroTimer()
    : PomodoroTimer(core::PomodoroConfig{}) {}

PomodoroTimer::PomodoroTimer(const core::PomodoroConfig &config)
    : m_config(config) {}

sint64 PomodoroTimer::DurationOf(Phase phase) const {
    switch (phase) {
    case Phase::Focus: return m_config.focusSeconds;
    case Phase::ShortBreak: return m_config.shortBreakSeconds;
    case Phase::LongBreak: return m_config.longBreakSeconds;
    }
    return m_config.focusSeconds;
}

void PomodoroTimer::Start(TimePoint now) {
    const sint64 total = DurationOf(m_phase);
    m_phaseTotalSeconds = total;
    m_remainingSeconds = total;
    m_state = TimerState::Running;
    m_lastTickAt = now;
    devlog::debug<grp::timer>("{} started, {} seconds", ToString(m_phase), total);
}

void PomodoroTimer::TogglePause(TimePoint now) {
    switch (m_state) {
    case TimerState::Running:
        m_state = TimerState::Paused;
        m_lastTickAt.reset();
        devlog::debug<grp::timer>("Paused with {} seconds left", m_remainingSeconds);
        break;
    case TimerState::Paused:
        m_state = TimerState::Running;
        m_lastTickAt = now;
        devlog::debug<grp::timer>("Resumed with {} seconds left", m_remainingSeconds);
        break;
    case TimerState::Idle: break;
    }
}

void PomodoroTimer::ClearCountdown() {
    m_state = TimerState::Idle;
    m_remainingSeconds = 0;
    m_phaseTotalSeconds = 0;
    m_lastTickAt.reset();
}

void PomodoroTimer::Stop() {
    ClearCountdown();
}

void PomodoroTimer::ResetPomodorosAndStop() {
    m_completedPomodoros = 0;
    m_phase = Phase::Focus;
    Stop();
    devlog::debug<grp::timer>("Pomodoro counter reset");
}

void PomodoroTimer::SetPhase(Phase phase) {
    m_phase = phase;
    Stop();
}

void PomodoroTimer::Tick(TimePoint now) {
    if (m_state != TimerState::Running || !m_lastTickAt) {
        return;
    }
    const sint64 elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - *m_lastTickAt).count();
    if (elapsed <= 0) {
        return;
    }
    m_lastTickAt = now;
    m_remainingSeconds = std::max<sint64>(0, m_remainingSeconds - elapsed);

    if (m_remainingSeconds == 0) {
        OnPhaseFinished();
    }
}

void PomodoroTimer::OnPhaseFinished() {
    const Phase justFinished = m_phase;
    const sint64 total = m_phaseTotalSeconds;

    ClearCountdown();
    m_finishedPhase = justFinished;
    if (justFinished == Phase::Focus) {
        m_lastCompletedFocusDuration = total;
    }

    switch (justFinished) {
    case Phase::Focus:
        ++m_completedPomodoros;
        if (m_completedPomodoros >= m_config.pomodorosBeforeLong) {
            m_phase = Phase::LongBreak;
            m_completedPomodoros = 0;
        } else {
            m_phase = Phase::ShortBreak;
        }
        break;
    case Phase::ShortBreak:
    case Phase::LongBreak: m_phase = Phase::Focus; break;
    }

    devlog::debug<grp::timer>("{} finished, next phase is {}", ToString(justFinished), ToString(m_phase));
}

void PomodoroTimer::Restore(Phase phase, TimerState state, sint64 remainingSeconds, sint64 phaseTotalSeconds,
                            uint32 completedPomodoros) {
    m_phase = phase;
    m_completedPomodoros = completedPomodoros < m_config.pomodorosBeforeLong ? completedPomodoros : 0;
    m_finishedPhase.reset();
    m_lastCompletedFocusDuration.reset();
    ClearCountdown();

    if (state == TimerState::Idle || phaseTotalSeconds <= 0) {
        devlog::debug<grp::timer>("Restored idle {} phase", ToString(m_phase));
        return;
    }

    // Time that passed while the state was stored is never counted
    m_state = TimerState::Paused;
    m_phaseTotalSeconds = phaseTotalSeconds;
    m_remainingSeconds = std::clamp<sint64>(remainingSeconds, 0, phaseTotalSeconds);
    if (m_remainingSeconds == 0) {
        ClearCountdown();
    }
    devlog::debug<grp::timer>("Restored paused {} phase with {}/{} seconds", ToString(m_phase), m_remainingSeconds,
                              m_phaseTotalSeconds);
}

std::optional<Phase> PomodoroTimer::TakeFinishedPhase() {
    return std::exchange(m_finishedPhase, std::nullopt);
}

std::optional<sint64> PomodoroTimer::TakeLastCompletedFocusDuration() {
    return std::exchange(m_lastCompletedFocusDuration, std::nullopt);
}

std::string PomodoroTimer::RemainingDisplay() const {
    const sint64 secs = std::max<sint64>(0, m_remainingSeconds);
    return fmt::format("{:02}:{:02}", secs / 60, secs % 60);
}

float PomodoroTimer::Progress() const {
    if (m_phaseTotalSeconds <= 0) {
        return 0.0f;
    }
    const sint64 remaining = std::max<sint64>(0, m_remainingSeconds);
    const sint64 elapsed = m_phaseTotalSeconds - remaining;
    return std::clamp(static_cast<float>(elapsed) / static_cast<float>(m_phaseTotalSeconds), 0.0f, 1.0f);
}

} // namespace tomato::timer
