#include "about_window.hpp"

#include <tomato/version.hpp>

#include <string>

using namespace tomato;

namespace app::ui {

AboutWindow::AboutWindow(SharedContext &context)
    : WindowBase(context, context.windows.about) {

    m_windowConfig.name = "About";
    m_windowConfig.flags = ImGuiWindowFlags_AlwaysAutoResize;
}

void AboutWindow::DrawContents() {
    ImGui::Text("Red Tomato %s", version::string);
    ImGui::TextUnformatted("A pomodoro timer that keeps a log of your focus sessions.");

    ImGui::Separator();

    // Copying the data directory carries the whole history to another machine
    const std::string dataDir = history::DataDirectory().string();
    ImGui::TextUnformatted("Data directory:");
    ImGui::Indent();
    ImGui::TextUnformatted(dataDir.c_str());
    ImGui::Unindent();
    if (ImGui::SmallButton("Copy path")) {
        ImGui::SetClipboardText(dataDir.c_str());
    }

    ImGui::Spacing();
    if (m_context.historyStore.IsOpen()) {
        ImGui::Text("History: %s", m_context.historyStore.Path().string().c_str());
    } else {
        ImGui::TextColored(m_context.colors.notice, "History unavailable: %s", m_context.historyError.c_str());
    }
    ImGui::Text("Settings: %s", m_context.settings.path.string().c_str());
}

} // namespace app::ui
