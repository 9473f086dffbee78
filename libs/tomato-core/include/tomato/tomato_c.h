#ifndef TOMATO_TOMATO_C_H
#define TOMATO_TOMATO_C_H

#include <tomato/export.h>

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct tomato_handle tomato_handle_t;

typedef enum tomato_result {
    TOMATO_RESULT_OK = 0,
    TOMATO_RESULT_INVALID_ARGUMENT = 1,
    TOMATO_RESULT_IO_ERROR = 2,
    TOMATO_RESULT_INTERNAL_ERROR = 3,
    TOMATO_RESULT_EMPTY = 4
} tomato_result_t;

typedef enum tomato_log_level {
    TOMATO_LOG_LEVEL_TRACE = 1,
    TOMATO_LOG_LEVEL_DEBUG = 2,
    TOMATO_LOG_LEVEL_INFO = 3,
    TOMATO_LOG_LEVEL_WARN = 4,
    TOMATO_LOG_LEVEL_ERROR = 5
} tomato_log_level_t;

typedef enum tomato_phase {
    TOMATO_PHASE_FOCUS = 0,
    TOMATO_PHASE_SHORT_BREAK = 1,
    TOMATO_PHASE_LONG_BREAK = 2
} tomato_phase_t;

typedef enum tomato_timer_state {
    TOMATO_TIMER_STATE_IDLE = 0,
    TOMATO_TIMER_STATE_RUNNING = 1,
    TOMATO_TIMER_STATE_PAUSED = 2
} tomato_timer_state_t;

typedef void (*tomato_log_callback_t)(void *user_data, tomato_log_level_t level, const char *message);

typedef struct tomato_config {
    uint32_t struct_size;
    int64_t focus_seconds;
    int64_t short_break_seconds;
    int64_t long_break_seconds;
    uint32_t pomodoros_before_long;
} tomato_config_t;

#define TOMATO_CONFIG_INIT                                                                                             \
    { sizeof(tomato_config_t), 25 * 60, 5 * 60, 15 * 60, 4u }

// Timestamps are Unix epoch milliseconds supplied by the caller; the library never reads a clock.
// Values outside half the range of the system clock (about +/-146 years with a nanosecond clock) are rejected
// with TOMATO_RESULT_INVALID_ARGUMENT.

// config may be NULL to use the defaults. Durations are clamped to their valid ranges.
TOMATO_CORE_EXPORT tomato_handle_t *tomato_create(const tomato_config_t *config);
TOMATO_CORE_EXPORT void tomato_destroy(tomato_handle_t *handle);

// Note: devlog output is global; the most recently set callback receives it.
TOMATO_CORE_EXPORT void tomato_set_log_callback(tomato_handle_t *handle, tomato_log_callback_t callback,
                                                void *user_data);

// Opens the focus history database. path may be NULL to use the default per-user location.
TOMATO_CORE_EXPORT tomato_result_t tomato_open_history(tomato_handle_t *handle, const char *path);

TOMATO_CORE_EXPORT tomato_result_t tomato_set_task(tomato_handle_t *handle, const char *task);

TOMATO_CORE_EXPORT tomato_result_t tomato_start(tomato_handle_t *handle, int64_t now_ms);
TOMATO_CORE_EXPORT tomato_result_t tomato_toggle_pause(tomato_handle_t *handle, int64_t now_ms);
TOMATO_CORE_EXPORT tomato_result_t tomato_stop(tomato_handle_t *handle);
TOMATO_CORE_EXPORT tomato_result_t tomato_reset_pomodoros_and_stop(tomato_handle_t *handle);
TOMATO_CORE_EXPORT tomato_result_t tomato_set_phase(tomato_handle_t *handle, tomato_phase_t phase);

// Advances the timer and records a completed focus phase in the history, if one finished.
TOMATO_CORE_EXPORT tomato_result_t tomato_tick(tomato_handle_t *handle, int64_t now_ms);

TOMATO_CORE_EXPORT tomato_phase_t tomato_get_phase(tomato_handle_t *handle);
TOMATO_CORE_EXPORT tomato_timer_state_t tomato_get_state(tomato_handle_t *handle);
TOMATO_CORE_EXPORT uint32_t tomato_get_completed_pomodoros(tomato_handle_t *handle);

// Writes "MM:SS" plus a terminator. Needs at least 6 bytes for durations under 100 minutes.
TOMATO_CORE_EXPORT tomato_result_t tomato_remaining_display(tomato_handle_t *handle, char *out_buffer,
                                                            size_t buffer_size);
TOMATO_CORE_EXPORT float tomato_progress(tomato_handle_t *handle);

// Drain-on-read: return TOMATO_RESULT_EMPTY when nothing is pending.
TOMATO_CORE_EXPORT tomato_result_t tomato_take_finished_phase(tomato_handle_t *handle, tomato_phase_t *out_phase);
TOMATO_CORE_EXPORT tomato_result_t tomato_take_last_completed_focus_duration(tomato_handle_t *handle,
                                                                             int64_t *out_seconds);

TOMATO_CORE_EXPORT const char *tomato_get_last_error(tomato_handle_t *handle);
TOMATO_CORE_EXPORT const char *tomato_get_version_string(void);

#ifdef __cplusplus
}
#endif

#endif
