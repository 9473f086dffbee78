#pragma once

#include "shared_context.hpp"

#include "ui/views/timer_view.hpp"
#include "ui/windows/about_window.hpp"
#include "ui/windows/history_window.hpp"

#include <tomato/session/settings.hpp>

#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <memory>

namespace app {

class App {
public:
    App();
    ~App();

    int Run();

private:
    tomato::session::Settings m_settings;
    SharedContext m_context;

    SDL_Window *m_window = nullptr;
    SDL_Renderer *m_renderer = nullptr;

    // Window flags currently applied to the SDL window
    bool m_appliedPinned = false;
    bool m_appliedCompact = false;

    std::unique_ptr<ui::TimerView> m_timerView;
    std::unique_ptr<ui::HistoryWindow> m_historyWindow;
    std::unique_ptr<ui::AboutWindow> m_aboutWindow;

    static tomato::session::Settings LoadSettings();
    void SaveSettings();
    void OpenHistory();

    bool InitGraphics();
    void ShutdownGraphics();
    void RescaleUI(float displayScale);

    void RunMainLoop();
    void DrawFrame();
    void DrawMainWindow();
    void DrawMenuBar();

    void ApplyWindowMode();
    void OnPhaseFinished(tomato::timer::Phase phase, bool focusRecorded);
};

} // namespace app
