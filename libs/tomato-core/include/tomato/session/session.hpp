#pragma once

/**
@file
@brief Host-side session controller.

Drives the pomodoro timer once per frame, turns completed focus phases into history records and writes them through
the history store. Persistence is best-effort: a failed write is logged and the in-memory history still receives the
record, so the running session always displays what actually happened.
*/

#include "session_snapshot.hpp"

#include <tomato/history/focus_record.hpp>
#include <tomato/history/history_store.hpp>
#include <tomato/timer/pomodoro_timer.hpp>

#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace tomato::session {

/// What happened during a single Session::Update call.
struct SessionUpdate {
    std::optional<timer::Phase> finishedPhase;
    std::optional<history::FocusRecord> recordedFocus;
    bool persisted = false;
};

class Session {
public:
    Session();
    explicit Session(const core::PomodoroConfig &config);

    timer::PomodoroTimer &Timer() {
        return m_timer;
    }

    const timer::PomodoroTimer &Timer() const {
        return m_timer;
    }

    void SetTask(std::string task) {
        m_task = std::move(task);
    }

    const std::string &Task() const {
        return m_task;
    }

    // The store is not owned and must outlive the session or be detached with nullptr.
    void AttachHistory(history::HistoryStore *store);

    // Replaces the cached history with the store's contents. Returns false and keeps the cache on failure.
    bool ReloadHistory();

    // Cached history, newest first.
    const std::vector<history::FocusRecord> &History() const {
        return m_history;
    }

    // Incremented whenever the cached history changes
    uint64 HistoryRevision() const {
        return m_historyRevision;
    }

    SessionUpdate Update(timer::TimePoint now);

    SessionSnapshot Capture() const;
    void Restore(const SessionSnapshot &snapshot);

private:
    timer::PomodoroTimer m_timer;
    std::string m_task;

    history::HistoryStore *m_store = nullptr;
    std::vector<history::FocusRecord> m_history;
    uint64 m_historyRevision = 0;
};

} // namespace tomato::session
