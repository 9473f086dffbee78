#pragma once

#include <tomato/history/history_store.hpp>
#include <tomato/session/session.hpp>
#include <tomato/session/settings.hpp>

#include <imgui.h>

#include <string>

struct SDL_Window;

namespace app {

struct SharedContext {
    explicit SharedContext(tomato::session::Settings &settings)
        : settings(settings)
        , session(settings.timer.Sanitized()) {}

    float displayScale = 1.0f;
    SDL_Window *window = nullptr;

    tomato::session::Settings &settings;
    tomato::history::HistoryStore historyStore;
    tomato::session::Session session;

    // Reason the history database could not be opened; empty when it is available
    std::string historyError;

    struct Colors {
        ImVec4 focus{0.86f, 0.24f, 0.20f, 1.00f};
        ImVec4 shortBreak{0.30f, 0.69f, 0.31f, 1.00f};
        ImVec4 longBreak{0.25f, 0.52f, 0.86f, 1.00f};
        ImVec4 notice{0.94f, 0.76f, 0.31f, 1.00f};
        ImVec4 idle{0.55f, 0.55f, 0.55f, 1.00f};
    } colors;

    struct Windows {
        bool history = false;
        bool about = false;
    } windows;

    const ImVec4 &PhaseColor(tomato::timer::Phase phase) const {
        switch (phase) {
        case tomato::timer::Phase::Focus: return colors.focus;
        case tomato::timer::Phase::ShortBreak: return colors.shortBreak;
        case tomato::timer::Phase::LongBreak: return colors.longBreak;
        }
        return colors.focus;
    }
};

} // namespace app
