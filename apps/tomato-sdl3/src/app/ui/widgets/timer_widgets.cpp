#include "timer_widgets.hpp"

#include <tomato/timer/timer_defs.hpp>

#include <imgui.h>

#include <array>
#include <utility>

using namespace tomato;

namespace app::ui::widgets {

namespace timer {

    void PhaseSelector(SharedContext &ctx) {
        auto &pomodoro = ctx.session.Timer();

        static constexpr std::array kPhases = {
            std::pair{tomato::timer::Phase::Focus, "Focus"},
            std::pair{tomato::timer::Phase::ShortBreak, "Short break"},
            std::pair{tomato::timer::Phase::LongBreak, "Long break"},
        };

        ImGui::PushID("##phase_sel");
        ImGui::BeginDisabled(!pomodoro.IsIdle());
        ImGui::BeginGroup();
        bool first = true;
        for (const auto &[phase, label] : kPhases) {
            if (!first) {
                ImGui::SameLine();
            }
            first = false;
            if (ImGui::RadioButton(label, pomodoro.GetPhase() == phase)) {
                pomodoro.SetPhase(phase);
            }
        }
        ImGui::EndGroup();
        ImGui::EndDisabled();
        if (!pomodoro.IsIdle() && ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenDisabled)) {
            ImGui::SetTooltip("Stop the timer to change phases");
        }
        ImGui::PopID();
    }

    void PomodoroCircles(SharedContext &ctx) {
        const auto &pomodoro = ctx.session.Timer();
        const uint32 total = pomodoro.GetConfig().pomodorosBeforeLong;
        const uint32 completed = pomodoro.CompletedPomodoros();

        const float radius = 6.0f * ctx.displayScale;
        const float spacing = 4.0f * ctx.displayScale;
        const ImU32 color = ImGui::GetColorU32(ctx.colors.focus);

        ImDrawList *drawList = ImGui::GetWindowDrawList();
        const ImVec2 origin = ImGui::GetCursorScreenPos();
        for (uint32 i = 0; i < total; i++) {
            const ImVec2 center{origin.x + radius + i * (radius * 2.0f + spacing), origin.y + radius};
            if (i < completed) {
                drawList->AddCircleFilled(center, radius, color);
            } else {
                drawList->AddCircle(center, radius, color, 0, 1.5f * ctx.displayScale);
            }
        }
        ImGui::Dummy(ImVec2(total * (radius * 2.0f + spacing), radius * 2.0f));
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%u of %u pomodoros before the long break", completed, total);
        }
    }

} // namespace timer

namespace window {

    void Pinned(SharedContext &ctx) {
        ImGui::Checkbox("Always on top", &ctx.settings.gui.pinned);
    }

    void Compact(SharedContext &ctx) {
        ImGui::Checkbox("Compact mode", &ctx.settings.gui.compact);
    }

} // namespace window

} // namespace app::ui::widgets
