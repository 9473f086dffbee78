#include "history_window.hpp"

namespace app::ui {

HistoryWindow::HistoryWindow(SharedContext &context)
    : WindowBase(context, context.windows.history)
    , m_historyView(context) {

    m_windowConfig.name = "Focus history";
}

void HistoryWindow::PrepareWindow() {
    ImGui::SetNextWindowSize(ImVec2(520 * m_context.displayScale, 320 * m_context.displayScale),
                             ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSizeConstraints(ImVec2(360 * m_context.displayScale, 160 * m_context.displayScale),
                                        ImVec2(FLT_MAX, FLT_MAX));
}

void HistoryWindow::DrawContents() {
    m_historyView.Display();
}

} // namespace app::ui
