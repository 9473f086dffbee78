#include "timer_view.hpp"

#include <app/ui/widgets/timer_widgets.hpp>

#include <tomato/util/utf8.hpp>

#include <cstring>
#include <string>

using namespace tomato;

namespace app::ui {

TimerView::TimerView(SharedContext &context)
    : m_context(context) {
    SyncTask();
}

void TimerView::SyncTask() {
    const std::string &task = m_context.session.Task();
    const size_t len = util::TruncatedUTF8Length(task, m_taskBuffer.size() - 1);
    std::memcpy(m_taskBuffer.data(), task.data(), len);
    m_taskBuffer[len] = '\0';
}

void TimerView::Display() {
    DisplayTask();
    ImGui::Spacing();

    widgets::timer::PhaseSelector(m_context);
    ImGui::Separator();

    ImGui::TextColored(m_context.PhaseColor(m_context.session.Timer().GetPhase()), "%s", PhaseLabel());
    DisplayClock(56.0f * m_context.displayScale);
    DisplayProgress(8.0f * m_context.displayScale);
    widgets::timer::PomodoroCircles(m_context);

    ImGui::Spacing();
    DisplayControls();
}

void TimerView::DisplayCompact() {
    ImGui::TextColored(m_context.PhaseColor(m_context.session.Timer().GetPhase()), "%s", PhaseLabel());
    ImGui::SameLine();
    DisplayStartPause();
    DisplayClock(32.0f * m_context.displayScale);
    DisplayProgress(4.0f * m_context.displayScale);
}

void TimerView::DisplayTask() {
    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted("Task:");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(-FLT_MIN);
    if (ImGui::InputTextWithHint("##task", "What are you working on?", m_taskBuffer.data(), m_taskBuffer.size())) {
        m_context.session.SetTask(m_taskBuffer.data());
    }
}

void TimerView::DisplayClock(float fontSize) {
    const std::string display = m_context.session.Timer().RemainingDisplay();
    const auto &pomodoro = m_context.session.Timer();
    const ImVec4 &color = pomodoro.IsIdle() ? m_context.colors.idle : m_context.PhaseColor(pomodoro.GetPhase());

    ImGui::PushFont(nullptr, fontSize);
    const float textWidth = ImGui::CalcTextSize(display.c_str()).x;
    const float avail = ImGui::GetContentRegionAvail().x;
    if (avail > textWidth) {
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + (avail - textWidth) * 0.5f);
    }
    ImGui::TextColored(color, "%s", display.c_str());
    ImGui::PopFont();
}

void TimerView::DisplayProgress(float height) {
    const auto &pomodoro = m_context.session.Timer();
    ImGui::PushStyleColor(ImGuiCol_PlotHistogram, m_context.PhaseColor(pomodoro.GetPhase()));
    ImGui::ProgressBar(pomodoro.Progress(), ImVec2(-FLT_MIN, height), "");
    ImGui::PopStyleColor();
}

void TimerView::DisplayStartPause() {
    auto &pomodoro = m_context.session.Timer();
    const auto now = timer::Clock::now();

    switch (pomodoro.GetState()) {
    case timer::TimerState::Idle:
        if (ImGui::Button("Start")) {
            pomodoro.Start(now);
        }
        break;
    case timer::TimerState::Running:
        if (ImGui::Button("Pause")) {
            pomodoro.TogglePause(now);
        }
        break;
    case timer::TimerState::Paused:
        if (ImGui::Button("Resume")) {
            pomodoro.TogglePause(now);
        }
        break;
    }
}

void TimerView::DisplayControls() {
    auto &pomodoro = m_context.session.Timer();

    DisplayStartPause();

    ImGui::SameLine();
    ImGui::BeginDisabled(pomodoro.IsIdle());
    if (ImGui::Button("Stop")) {
        pomodoro.Stop();
    }
    ImGui::EndDisabled();

    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        pomodoro.ResetPomodorosAndStop();
    }
    if (ImGui::BeginItemTooltip()) {
        ImGui::TextUnformatted("Stops the timer, clears the pomodoro count and returns to focus");
        ImGui::EndTooltip();
    }
}

const char *TimerView::PhaseLabel() const {
    const auto &pomodoro = m_context.session.Timer();
    switch (pomodoro.GetPhase()) {
    case timer::Phase::Focus: return pomodoro.GetState() == timer::TimerState::Paused ? "Focus (paused)" : "Focus";
    case timer::Phase::ShortBreak:
        return pomodoro.GetState() == timer::TimerState::Paused ? "Short break (paused)" : "Short break";
    case timer::Phase::LongBreak:
        return pomodoro.GetState() == timer::TimerState::Paused ? "Long break (paused)" : "Long break";
    }
    return "";
}

} // namespace app::ui
