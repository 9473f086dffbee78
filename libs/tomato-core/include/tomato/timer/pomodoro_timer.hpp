#pragma once

/**
@file
@brief Pomodoro timer state machine.

The timer never samples a clock. Every operation that needs the current time takes it from the caller, and the
countdown is advanced from timestamp deltas in `Tick`, so the host may call it at any cadence.

Completion is handed off through two drain-on-read slots: `TakeFinishedPhase` reports which phase just ended and
`TakeLastCompletedFocusDuration` reports the configured duration of a completed focus phase.
*/

#include "timer_defs.hpp"

#include <tomato/core/configuration.hpp>

#include <optional>
#include <string>

namespace tomato::timer {

class PomodoroTimer {
public:
    PomodoroTimer();
    explicit PomodoroTimer(const core::PomodoroConfig &config);

    // -------------------------------------------------------------------------
    // Commands

    // Starts the current phase from its full configured duration. Restarts the countdown if already running.
    void Start(TimePoint now);

    // Running -> Paused freezes the countdown; Paused -> Running resumes it from the frozen value. No-op when idle.
    void TogglePause(TimePoint now);

    // Returns to Idle and clears the countdown. Keeps the phase and the pomodoro counter.
    void Stop();

    // Clears the pomodoro counter, selects Focus and stops.
    void ResetPomodorosAndStop();

    // Selects a phase and stops. Callers normally only offer this while idle.
    void SetPhase(Phase phase);

    // Advances the countdown by the whole seconds elapsed since the previous tick.
    // Non-positive deltas are ignored.
    void Tick(TimePoint now);

    // Re-enters a persisted state. A running state is restored as paused and out-of-range values are clamped.
    void Restore(Phase phase, TimerState state, sint64 remainingSeconds, sint64 phaseTotalSeconds,
                 uint32 completedPomodoros);

    // -------------------------------------------------------------------------
    // Completion hand-off

    std::optional<Phase> TakeFinishedPhase();
    std::optional<sint64> TakeLastCompletedFocusDuration();

    // -------------------------------------------------------------------------
    // Accessors

    // Remaining time formatted as MM:SS.
    std::string RemainingDisplay() const;

    // Fraction of the current phase already elapsed, in [0, 1]. 0 when no phase is active.
    float Progress() const;

    const core::PomodoroConfig &GetConfig() const {
        return m_config;
    }

    Phase GetPhase() const {
        return m_phase;
    }

    TimerState GetState() const {
        return m_state;
    }

    sint64 RemainingSeconds() const {
        return m_remainingSeconds;
    }

    sint64 PhaseTotalSeconds() const {
        return m_phaseTotalSeconds;
    }

    uint32 CompletedPomodoros() const {
        return m_completedPomodoros;
    }

    bool IsIdle() const {
        return m_state == TimerState::Idle;
    }

    sint64 DurationOf(Phase phase) const;

private:
    core::PomodoroConfig m_config;

    Phase m_phase = Phase::Focus;
    TimerState m_state = TimerState::Idle;
    sint64 m_remainingSeconds = 0;
    sint64 m_phaseTotalSeconds = 0;
    uint32 m_completedPomodoros = 0;

    // Set only while running
    std::optional<TimePoint> m_lastTickAt;

    std::optional<Phase> m_finishedPhase;
    std::optional<sint64> m_lastCompletedFocusDuration;

    void ClearCountdown();
    void OnPhaseFinished();
};

} // namespace tomato::timer
