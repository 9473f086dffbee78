#include "app.hpp"

#include <app/ui/widgets/timer_widgets.hpp>

#include <tomato/util/dev_log.hpp>

#include <SDL3/SDL.h>

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

using namespace tomato;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   gfx

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "App";
    };

    struct gfx : public base {
        static constexpr std::string_view name = "App-Graphics";
    };

} // namespace grp

namespace {

    constexpr int kDefaultWindowWidth = 380;
    constexpr int kDefaultWindowHeight = 300;
    constexpr int kCompactWindowWidth = 220;
    constexpr int kCompactWindowHeight = 96;

} // namespace

App::App()
    : m_settings(LoadSettings())
    , m_context(m_settings) {

    m_context.session.Restore(m_settings.session);
}

App::~App() {
    ShutdownGraphics();
}

int App::Run() {
    OpenHistory();

    if (!InitGraphics()) {
        SaveSettings();
        return 1;
    }

    m_timerView = std::make_unique<ui::TimerView>(m_context);
    m_historyWindow = std::make_unique<ui::HistoryWindow>(m_context);
    m_aboutWindow = std::make_unique<ui::AboutWindow>(m_context);

    RunMainLoop();

    SaveSettings();
    ShutdownGraphics();
    return 0;
}

// -----------------------------------------------------------------------------
// Persistence

session::Settings App::LoadSettings() {
    session::Settings settings{};
    const auto path = history::DataDirectory() / session::kSettingsFileName;
    if (auto result = settings.Load(path); !result) {
        // Settings are left at their defaults
        devlog::warn<grp::base>("Could not load settings from {}: {}", path.string(), result.string());
    }
    return settings;
}

void App::SaveSettings() {
    m_settings.session = m_context.session.Capture();
    if (auto result = m_settings.Save(); !result) {
        devlog::warn<grp::base>("Could not save settings: {}", result.string());
    } else {
        devlog::debug<grp::base>("Saved settings to {}", m_settings.path.string());
    }
}

void App::OpenHistory() {
    if (auto result = m_context.historyStore.Open(history::DatabasePath()); !result) {
        // Keep running without persistence; completed focus phases stay in memory
        m_context.historyError = result.string();
        devlog::error<grp::base>("History database unavailable: {}", m_context.historyError);
        return;
    }
    m_context.historyError.clear();
    m_context.session.AttachHistory(&m_context.historyStore);
    if (!m_context.session.ReloadHistory()) {
        devlog::warn<grp::base>("Previously recorded focus sessions could not be loaded");
    }
}

// -----------------------------------------------------------------------------
// Graphics

bool App::InitGraphics() {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        devlog::error<grp::gfx>("Unable to initialize SDL: {}", SDL_GetError());
        return false;
    }

    SDL_WindowFlags flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIDDEN | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    m_window = SDL_CreateWindow("Red Tomato", kDefaultWindowWidth, kDefaultWindowHeight, flags);
    if (m_window == nullptr) {
        devlog::error<grp::gfx>("Unable to create window: {}", SDL_GetError());
        return false;
    }
    m_context.window = m_window;

    m_renderer = SDL_CreateRenderer(m_window, nullptr);
    if (m_renderer == nullptr) {
        devlog::error<grp::gfx>("Unable to create renderer: {}", SDL_GetError());
        return false;
    }
    if (!SDL_SetRenderVSync(m_renderer, 1)) {
        devlog::debug<grp::gfx>("VSync unavailable: {}", SDL_GetError());
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.IniFilename = nullptr;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();
    RescaleUI(SDL_GetWindowDisplayScale(m_window));

    ImGui_ImplSDL3_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer3_Init(m_renderer);

    ApplyWindowMode();
    SDL_ShowWindow(m_window);

    devlog::info<grp::gfx>("Using renderer {}", SDL_GetRendererName(m_renderer));
    return true;
}

void App::ShutdownGraphics() {
    if (ImGui::GetCurrentContext() != nullptr) {
        ImGui_ImplSDLRenderer3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
    }
    if (m_renderer != nullptr) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window != nullptr) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
        m_context.window = nullptr;
    }
    SDL_Quit();
}

void App::RescaleUI(float displayScale) {
    if (displayScale <= 0.0f) {
        displayScale = 1.0f;
    }
    m_context.displayScale = displayScale;

    ImGuiStyle &style = ImGui::GetStyle();
    style = ImGuiStyle{};
    ImGui::StyleColorsDark(&style);
    style.WindowRounding = 6.0f;
    style.FrameRounding = 4.0f;
    style.ScaleAllSizes(displayScale);
    style.FontScaleDpi = displayScale;
}

// -----------------------------------------------------------------------------
// Main loop

void App::RunMainLoop() {
    bool running = true;
    while (running) {
        SDL_Event evt{};
        while (SDL_PollEvent(&evt)) {
            ImGui_ImplSDL3_ProcessEvent(&evt);
            switch (evt.type) {
            case SDL_EVENT_QUIT: running = false; break;
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                if (evt.window.windowID == SDL_GetWindowID(m_window)) {
                    running = false;
                }
                break;
            case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED: RescaleUI(SDL_GetWindowDisplayScale(m_window)); break;
            default: break;
            }
        }

        const auto update = m_context.session.Update(timer::Clock::now());
        if (update.finishedPhase) {
            OnPhaseFinished(*update.finishedPhase, update.recordedFocus.has_value());
        }

        if (m_settings.gui.pinned != m_appliedPinned || m_settings.gui.compact != m_appliedCompact) {
            ApplyWindowMode();
        }

        DrawFrame();

        // Nothing changes on screen while the timer is stopped, so sleep until input arrives
        if (m_context.session.Timer().GetState() != timer::TimerState::Running) {
            SDL_WaitEventTimeout(nullptr, 250);
        }
    }
}

void App::DrawFrame() {
    ImGui_ImplSDLRenderer3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();

    DrawMainWindow();
    m_historyWindow->Display();
    m_aboutWindow->Display();

    ImGui::Render();
    ImGuiIO &io = ImGui::GetIO();
    SDL_SetRenderScale(m_renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);
    SDL_SetRenderDrawColor(m_renderer, 24, 24, 28, 255);
    SDL_RenderClear(m_renderer);
    ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

void App::DrawMainWindow() {
    const ImGuiViewport *viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoSavedSettings;
    if (!m_settings.gui.compact) {
        flags |= ImGuiWindowFlags_MenuBar;
    }

    if (ImGui::Begin("##main", nullptr, flags)) {
        if (m_settings.gui.compact) {
            m_timerView->DisplayCompact();
            if (ImGui::BeginPopupContextWindow("##compact_ctx")) {
                ui::widgets::window::Compact(m_context);
                ui::widgets::window::Pinned(m_context);
                ImGui::EndPopup();
            }
        } else {
            DrawMenuBar();
            m_timerView->Display();
        }
    }
    ImGui::End();
}

void App::DrawMenuBar() {
    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("View")) {
            ImGui::MenuItem("Focus history", nullptr, &m_context.windows.history);
            ImGui::Separator();
            ui::widgets::window::Pinned(m_context);
            ui::widgets::window::Compact(m_context);
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("Help")) {
            ImGui::MenuItem("About", nullptr, &m_context.windows.about);
            ImGui::EndMenu();
        }
        ImGui::EndMenuBar();
    }
}

// -----------------------------------------------------------------------------
// Window mode

void App::ApplyWindowMode() {
    if (!SDL_SetWindowAlwaysOnTop(m_window, m_settings.gui.pinned)) {
        devlog::warn<grp::gfx>("Could not change always-on-top mode: {}", SDL_GetError());
    }
    m_appliedPinned = m_settings.gui.pinned;

    if (m_settings.gui.compact != m_appliedCompact) {
        const int width = m_settings.gui.compact ? kCompactWindowWidth : kDefaultWindowWidth;
        const int height = m_settings.gui.compact ? kCompactWindowHeight : kDefaultWindowHeight;
        if (!SDL_SetWindowSize(m_window, width, height)) {
            devlog::warn<grp::gfx>("Could not resize window: {}", SDL_GetError());
        }
    }
    m_appliedCompact = m_settings.gui.compact;
}

void App::OnPhaseFinished(timer::Phase phase, bool focusRecorded) {
    const auto &pomodoro = m_context.session.Timer();
    devlog::info<grp::base>("{} finished, next up: {}", timer::ToString(phase), timer::ToString(pomodoro.GetPhase()));
    if (focusRecorded) {
        devlog::debug<grp::base>("{} pomodoros completed in this cycle", pomodoro.CompletedPomodoros());
    }

    if (!SDL_FlashWindow(m_window, SDL_FLASH_UNTIL_FOCUSED)) {
        devlog::debug<grp::gfx>("Window flash unavailable: {}", SDL_GetError());
    }
}

} // namespace app
