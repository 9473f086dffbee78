#include <tomato/tomato_c.h>

#include <tomato/history/history_store.hpp>
#include <tomato/session/session.hpp>
#include <tomato/util/dev_log.hpp>
#include <tomato/version.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstring>
#include <exception>
#include <optional>
#include <string>
#include <utility>

// handle struct
// a session plus its history store and the pending completion slots exposed to the caller
struct tomato_handle {
    tomato::history::HistoryStore store;
    tomato::session::Session session;
    std::optional<tomato::timer::Phase> pending_finished_phase;
    std::optional<sint64> pending_focus_duration;
    tomato_log_callback_t log_callback = nullptr;
    void *log_user_data = nullptr;
    std::string last_error;

    explicit tomato_handle(const tomato::core::PomodoroConfig &config)
        : session(config) {}
};

namespace {

using tomato::timer::Phase;
using tomato::timer::TimerState;

// switch devlog level to enum
tomato_log_level_t ToLogLevel(devlog::Level level) {
    switch (level) {
    case devlog::level::trace: return TOMATO_LOG_LEVEL_TRACE;
    case devlog::level::debug: return TOMATO_LOG_LEVEL_DEBUG;
    case devlog::level::info: return TOMATO_LOG_LEVEL_INFO;
    case devlog::level::warn: return TOMATO_LOG_LEVEL_WARN;
    case devlog::level::error: return TOMATO_LOG_LEVEL_ERROR;
    default: return TOMATO_LOG_LEVEL_INFO;
    }
}

// Half the clock's range, so the difference of two accepted timestamps is representable as well
constexpr int64_t kMaxUnixMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(tomato::timer::Clock::duration::max()).count() / 2;

bool TryFromUnixMillis(int64_t nowMs, tomato::timer::TimePoint &out) {
    if (nowMs > kMaxUnixMillis || nowMs < -kMaxUnixMillis) {
        return false;
    }
    out = tomato::timer::TimePoint{
        std::chrono::duration_cast<tomato::timer::Clock::duration>(std::chrono::milliseconds{nowMs})};
    return true;
}

bool TryConvert(tomato_phase_t phase, Phase &out) {
    switch (phase) {
    case TOMATO_PHASE_FOCUS: out = Phase::Focus; return true;
    case TOMATO_PHASE_SHORT_BREAK: out = Phase::ShortBreak; return true;
    case TOMATO_PHASE_LONG_BREAK: out = Phase::LongBreak; return true;
    }
    return false;
}

tomato_phase_t Convert(Phase phase) {
    switch (phase) {
    case Phase::Focus: return TOMATO_PHASE_FOCUS;
    case Phase::ShortBreak: return TOMATO_PHASE_SHORT_BREAK;
    case Phase::LongBreak: return TOMATO_PHASE_LONG_BREAK;
    }
    return TOMATO_PHASE_FOCUS;
}

// invoke callback to log level /w message
void DevLogSink(devlog::Level level, const char *message, void *user_data) {
    auto *handle = static_cast<tomato_handle *>(user_data);
    if (handle == nullptr) {
        return;
    }
    if (handle->log_callback == nullptr) {
        return;
    }
    handle->log_callback(handle->log_user_data, ToLogLevel(level), message);
}

void SetLastError(tomato_handle *handle, tomato_log_level_t level, std::string message) {
    if (handle == nullptr) {
        return;
    }
    handle->last_error = std::move(message);
    if (handle->log_callback != nullptr) {
        handle->log_callback(handle->log_user_data, level, handle->last_error.c_str());
    }
}

void ClearLastError(tomato_handle *handle) {
    if (handle == nullptr) {
        return;
    }
    handle->last_error.clear();
}

void DetachLogSink(tomato_handle *handle) {
    const auto sink_state = devlog::GetLogSink();
    if (sink_state.sink == &DevLogSink && sink_state.user_data == handle) {
        devlog::SetLogSink(nullptr, nullptr);
    }
}

} // namespace

extern "C" {

// creates and returns new session handle based on config
tomato_handle_t *tomato_create(const tomato_config_t *config) {
    tomato::core::PomodoroConfig pomodoroConfig{};
    if (config != nullptr && config->struct_size >= sizeof(tomato_config_t)) {
        pomodoroConfig.focusSeconds = config->focus_seconds;
        pomodoroConfig.shortBreakSeconds = config->short_break_seconds;
        pomodoroConfig.longBreakSeconds = config->long_break_seconds;
        pomodoroConfig.pomodorosBeforeLong = config->pomodoros_before_long;
    }

    try {
        return new tomato_handle(pomodoroConfig.Sanitized());
    } catch (const std::exception &) {
        return nullptr;
    }
}

// resets log sink, then destroys handle (closing the history database)
void tomato_destroy(tomato_handle_t *handle) {
    if (handle != nullptr) {
        handle->session.AttachHistory(nullptr);
        DetachLogSink(handle);
    }
    delete handle;
}

void tomato_set_log_callback(tomato_handle_t *handle, tomato_log_callback_t callback, void *user_data) {
    if (handle == nullptr) {
        return;
    }
    handle->log_callback = callback;
    handle->log_user_data = user_data;
    if (callback != nullptr) {
        devlog::SetLogSink(&DevLogSink, handle);
    } else {
        DetachLogSink(handle);
    }
}

tomato_result_t tomato_open_history(tomato_handle_t *handle, const char *path) {
    if (handle == nullptr) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }

    try {
        const std::filesystem::path dbPath =
            path != nullptr && path[0] != '\0' ? std::filesystem::path{path} : tomato::history::DatabasePath();
        if (auto result = handle->store.Open(dbPath); !result) {
            handle->session.AttachHistory(nullptr);
            SetLastError(handle, TOMATO_LOG_LEVEL_ERROR,
                         fmt::format("Failed to open history database: {}", result.string()));
            return TOMATO_RESULT_IO_ERROR;
        }
        handle->session.AttachHistory(&handle->store);
        ClearLastError(handle);
        if (!handle->session.ReloadHistory()) {
            SetLastError(handle, TOMATO_LOG_LEVEL_WARN, "History database opened but existing records were not loaded");
        }
        return TOMATO_RESULT_OK;
    } catch (const std::exception &ex) {
        SetLastError(handle, TOMATO_LOG_LEVEL_ERROR,
                     fmt::format("Exception while opening history database: {}", ex.what()));
        return TOMATO_RESULT_INTERNAL_ERROR;
    }
}

tomato_result_t tomato_set_task(tomato_handle_t *handle, const char *task) {
    if (handle == nullptr || task == nullptr) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    handle->session.SetTask(task);
    return TOMATO_RESULT_OK;
}

tomato_result_t tomato_start(tomato_handle_t *handle, int64_t now_ms) {
    tomato::timer::TimePoint now{};
    if (handle == nullptr || !TryFromUnixMillis(now_ms, now)) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    handle->session.Timer().Start(now);
    return TOMATO_RESULT_OK;
}

tomato_result_t tomato_toggle_pause(tomato_handle_t *handle, int64_t now_ms) {
    tomato::timer::TimePoint now{};
    if (handle == nullptr || !TryFromUnixMillis(now_ms, now)) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    handle->session.Timer().TogglePause(now);
    return TOMATO_RESULT_OK;
}

tomato_result_t tomato_stop(tomato_handle_t *handle) {
    if (handle == nullptr) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    handle->session.Timer().Stop();
    return TOMATO_RESULT_OK;
}

tomato_result_t tomato_reset_pomodoros_and_stop(tomato_handle_t *handle) {
    if (handle == nullptr) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    handle->session.Timer().ResetPomodorosAndStop();
    return TOMATO_RESULT_OK;
}

tomato_result_t tomato_set_phase(tomato_handle_t *handle, tomato_phase_t phase) {
    Phase value{};
    if (handle == nullptr || !TryConvert(phase, value)) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    handle->session.Timer().SetPhase(value);
    return TOMATO_RESULT_OK;
}

tomato_result_t tomato_tick(tomato_handle_t *handle, int64_t now_ms) {
    tomato::timer::TimePoint now{};
    if (handle == nullptr || !TryFromUnixMillis(now_ms, now)) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }

    try {
        auto update = handle->session.Update(now);
        if (update.finishedPhase) {
            handle->pending_finished_phase = update.finishedPhase;
        }
        if (update.recordedFocus) {
            handle->pending_focus_duration = update.recordedFocus->durationSeconds;
        }
        return TOMATO_RESULT_OK;
    } catch (const std::exception &ex) {
        SetLastError(handle, TOMATO_LOG_LEVEL_ERROR, fmt::format("Exception while ticking: {}", ex.what()));
        return TOMATO_RESULT_INTERNAL_ERROR;
    }
}

tomato_phase_t tomato_get_phase(tomato_handle_t *handle) {
    if (handle == nullptr) {
        return TOMATO_PHASE_FOCUS;
    }
    return Convert(handle->session.Timer().GetPhase());
}

tomato_timer_state_t tomato_get_state(tomato_handle_t *handle) {
    if (handle == nullptr) {
        return TOMATO_TIMER_STATE_IDLE;
    }
    switch (handle->session.Timer().GetState()) {
    case TimerState::Idle: return TOMATO_TIMER_STATE_IDLE;
    case TimerState::Running: return TOMATO_TIMER_STATE_RUNNING;
    case TimerState::Paused: return TOMATO_TIMER_STATE_PAUSED;
    }
    return TOMATO_TIMER_STATE_IDLE;
}

uint32_t tomato_get_completed_pomodoros(tomato_handle_t *handle) {
    if (handle == nullptr) {
        return 0;
    }
    return handle->session.Timer().CompletedPomodoros();
}

tomato_result_t tomato_remaining_display(tomato_handle_t *handle, char *out_buffer, size_t buffer_size) {
    if (handle == nullptr || out_buffer == nullptr) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    const std::string display = handle->session.Timer().RemainingDisplay();
    if (buffer_size < display.size() + 1) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    std::memcpy(out_buffer, display.c_str(), display.size() + 1);
    return TOMATO_RESULT_OK;
}

float tomato_progress(tomato_handle_t *handle) {
    if (handle == nullptr) {
        return 0.0f;
    }
    return handle->session.Timer().Progress();
}

tomato_result_t tomato_take_finished_phase(tomato_handle_t *handle, tomato_phase_t *out_phase) {
    if (handle == nullptr || out_phase == nullptr) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    const auto phase = std::exchange(handle->pending_finished_phase, std::nullopt);
    if (!phase) {
        return TOMATO_RESULT_EMPTY;
    }
    *out_phase = Convert(*phase);
    return TOMATO_RESULT_OK;
}

tomato_result_t tomato_take_last_completed_focus_duration(tomato_handle_t *handle, int64_t *out_seconds) {
    if (handle == nullptr || out_seconds == nullptr) {
        return TOMATO_RESULT_INVALID_ARGUMENT;
    }
    const auto duration = std::exchange(handle->pending_focus_duration, std::nullopt);
    if (!duration) {
        return TOMATO_RESULT_EMPTY;
    }
    *out_seconds = *duration;
    return TOMATO_RESULT_OK;
}

const char *tomato_get_last_error(tomato_handle_t *handle) {
    if (handle == nullptr) {
        return nullptr;
    }
    if (handle->last_error.empty()) {
        return nullptr;
    }
    return handle->last_error.c_str();
}

const char *tomato_get_version_string(void) {
    return tomato::version::string;
}

} // extern "C"
