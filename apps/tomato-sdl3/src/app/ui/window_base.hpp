#pragma once

#include <app/shared_context.hpp>

#include <imgui.h>

#include <string>

namespace app::ui {

struct WindowConfig {
    std::string name;
    ImGuiWindowFlags flags = ImGuiWindowFlags_None;
};

class WindowBase {
public:
    WindowBase(SharedContext &context, bool &open);
    virtual ~WindowBase() = default;

    void Display();

protected:
    SharedContext &m_context;
    WindowConfig m_windowConfig;

    // Invoked before ImGui::Begin, e.g. to set size constraints
    virtual void PrepareWindow() {}

    virtual void DrawContents() = 0;

private:
    bool &m_open;
};

} // namespace app::ui
