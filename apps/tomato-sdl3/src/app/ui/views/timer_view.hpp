#pragma once

#include <app/shared_context.hpp>

#include <array>

namespace app::ui {

class TimerView {
public:
    explicit TimerView(SharedContext &context);

    // Task field, phase selectors, clock, progress and controls.
    void Display();

    // Clock, progress and the start/pause button only.
    void DisplayCompact();

    // Reloads the task field from the session after it was restored.
    void SyncTask();

private:
    SharedContext &m_context;

    std::array<char, 256> m_taskBuffer{};

    void DisplayTask();
    void DisplayClock(float fontSize);
    void DisplayProgress(float height);
    void DisplayStartPause();
    void DisplayControls();

    const char *PhaseLabel() const;
};

} // namespace app::ui
