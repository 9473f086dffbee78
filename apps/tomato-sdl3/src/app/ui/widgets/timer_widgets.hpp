#pragma once

#include <app/shared_context.hpp>

namespace app::ui::widgets {

namespace timer {

    // Phase selectors. Only enabled while the timer is idle.
    void PhaseSelector(SharedContext &ctx);

    // One circle per pomodoro in the cycle, filled for those already completed.
    void PomodoroCircles(SharedContext &ctx);

} // namespace timer

namespace window {

    void Pinned(SharedContext &ctx);
    void Compact(SharedContext &ctx);

} // namespace window

} // namespace app::ui::widgets
