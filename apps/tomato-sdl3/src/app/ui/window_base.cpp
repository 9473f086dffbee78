#include "window_base.hpp"

namespace app::ui {

WindowBase::WindowBase(SharedContext &context, bool &open)
    : m_context(context)
    , m_open(open) {}

void WindowBase::Display() {
    if (!m_open) {
        return;
    }

    PrepareWindow();
    if (ImGui::Begin(m_windowConfig.name.c_str(), &m_open, m_windowConfig.flags)) {
        DrawContents();
    }
    ImGui::End();
}

} // namespace app::ui
