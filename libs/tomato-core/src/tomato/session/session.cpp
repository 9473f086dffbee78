#include <tomato/session/session.hpp>

#include <tomato/util/dev_log.hpp>
#include <tomato/util/timestamp.hpp>

#include <utility>

namespace tomato::session {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // session

    struct session {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Session";
    };

} // namespace grp

Session::Session()
    : Session(core::PomodoroConfig{}) {}

Session::Session(const core::PomodoroConfig &config)
    : m_timer(config) {}

void Session::AttachHistory(history::HistoryStore *store) {
    m_store = store;
}

bool Session::ReloadHistory() {
    if (m_store == nullptr) {
        return false;
    }

    std::vector<history::FocusRecord> records{};
    if (auto result = m_store->Load(0, records); !result) {
        devlog::warn<grp::session>("Could not load focus history: {}", result.string());
        return false;
    }
    m_history = std::move(records);
    ++m_historyRevision;
    devlog::debug<grp::session>("Loaded {} focus records", m_history.size());
    return true;
}

SessionUpdate Session::Update(timer::TimePoint now) {
    SessionUpdate update{};

    m_timer.Tick(now);
    update.finishedPhase = m_timer.TakeFinishedPhase();

    if (auto duration = m_timer.TakeLastCompletedFocusDuration()) {
        history::FocusRecord record{
            .task = m_task,
            .durationSeconds = *duration,
            .completedAt = util::FormatTimestamp(now),
            .completedPomodoros = m_timer.CompletedPomodoros(),
        };

        if (m_store != nullptr) {
            if (auto result = m_store->Append(record)) {
                update.persisted = true;
            } else {
                devlog::warn<grp::session>("Focus record not persisted: {}", result.string());
            }
        } else {
            devlog::debug<grp::session>("No history store attached, keeping focus record in memory only");
        }

        m_history.insert(m_history.begin(), record);
        ++m_historyRevision;
        update.recordedFocus = std::move(record);
    }

    return update;
}

SessionSnapshot Session::Capture() const {
    return {
        .task = m_task,
        .phase = m_timer.GetPhase(),
        .state = m_timer.GetState(),
        .remainingSeconds = m_timer.RemainingSeconds(),
        .phaseTotalSeconds = m_timer.PhaseTotalSeconds(),
        .completedPomodoros = m_timer.CompletedPomodoros(),
    };
}

void Session::Restore(const SessionSnapshot &snapshot) {
    m_task = snapshot.task;
    m_timer.Restore(snapshot.phase, snapshot.state, snapshot.remainingSeconds, snapshot.phaseTotalSeconds,
                    snapshot.completedPomodoros);
}

} // namespace tomato::session
