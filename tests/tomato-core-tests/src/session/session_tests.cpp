#include <catch2/catch_test_macros.hpp>

#include <tomato/session/session.hpp>

#include "temp_dir.hpp"

using namespace tomato;
using namespace std::chrono_literals;

namespace session_tests {

inline constexpr timer::TimePoint kT0{1'700'000'000s};

core::PomodoroConfig MakeConfig() {
    return {
        .focusSeconds = 60,
        .shortBreakSeconds = 10,
        .longBreakSeconds = 20,
        .pomodorosBeforeLong = 2,
    };
}

// Runs the current phase to completion and returns the update reporting it.
session::SessionUpdate CompletePhase(session::Session &session, timer::TimePoint &now) {
    session.Timer().Start(now);
    now += std::chrono::seconds{session.Timer().PhaseTotalSeconds()};
    return session.Update(now);
}

TEST_CASE("Session records completed focus phases in memory", "[session]") {
    session::Session session{MakeConfig()};
    session.SetTask("write tests");

    auto now = kT0;
    session.Timer().Start(now);
    now += 30s;
    auto update = session.Update(now);
    CHECK_FALSE(update.finishedPhase);
    CHECK_FALSE(update.recordedFocus);

    now += 30s;
    update = session.Update(now);
    REQUIRE(update.finishedPhase == timer::Phase::Focus);
    REQUIRE(update.recordedFocus);
    CHECK_FALSE(update.persisted);

    const auto &record = *update.recordedFocus;
    CHECK(record.task == "write tests");
    CHECK(record.durationSeconds == 60);
    CHECK(record.completedAt == "2023-11-15T06:14:20+08:00");
    CHECK(record.completedPomodoros == 1);

    REQUIRE(session.History().size() == 1);
    CHECK(session.History().front() == record);

    // Completion is reported once
    update = session.Update(now + 1s);
    CHECK_FALSE(update.finishedPhase);
    CHECK_FALSE(update.recordedFocus);
}

TEST_CASE("Session does not record breaks", "[session]") {
    session::Session session{MakeConfig()};
    auto now = kT0;

    REQUIRE(CompletePhase(session, now).recordedFocus);
    REQUIRE(session.Timer().GetPhase() == timer::Phase::ShortBreak);

    auto update = CompletePhase(session, now);
    CHECK(update.finishedPhase == timer::Phase::ShortBreak);
    CHECK_FALSE(update.recordedFocus);
    CHECK(session.History().size() == 1);
}

TEST_CASE("Session keeps its history newest first", "[session]") {
    session::Session session{MakeConfig()};
    auto now = kT0;

    session.SetTask("first");
    REQUIRE(CompletePhase(session, now).recordedFocus);
    CompletePhase(session, now); // short break
    session.SetTask("second");
    auto update = CompletePhase(session, now);
    REQUIRE(update.recordedFocus);

    // The second focus completes the cycle, resetting the counter for the long break
    CHECK(session.Timer().GetPhase() == timer::Phase::LongBreak);
    CHECK(update.recordedFocus->completedPomodoros == 0);

    REQUIRE(session.History().size() == 2);
    CHECK(session.History()[0].task == "second");
    CHECK(session.History()[1].task == "first");
}

TEST_CASE("Session persists records through an attached store", "[session][history]") {
    test_util::TempDir dir{};
    history::HistoryStore store{};
    REQUIRE(store.Open(dir.path / "history.db"));

    session::Session session{MakeConfig()};
    session.AttachHistory(&store);
    session.SetTask("persisted");

    auto now = kT0;
    auto update = CompletePhase(session, now);
    REQUIRE(update.recordedFocus);
    CHECK(update.persisted);
    CHECK(update.recordedFocus->id > 0);

    std::vector<history::FocusRecord> records{};
    REQUIRE(store.Load(0, records));
    REQUIRE(records.size() == 1);
    CHECK(records[0] == *update.recordedFocus);

    SECTION("reloading replaces the cache with the store contents") {
        session::Session other{MakeConfig()};
        other.AttachHistory(&store);
        REQUIRE(other.ReloadHistory());
        REQUIRE(other.History().size() == 1);
        CHECK(other.History()[0] == records[0]);
    }
}

TEST_CASE("Session keeps records in memory when persistence fails", "[session][history][errors]") {
    history::HistoryStore store{}; // never opened

    session::Session session{MakeConfig()};
    session.AttachHistory(&store);

    auto now = kT0;
    auto update = CompletePhase(session, now);
    REQUIRE(update.recordedFocus);
    CHECK_FALSE(update.persisted);
    CHECK(update.recordedFocus->id == 0);
    CHECK(session.History().size() == 1);

    // A failed reload keeps the cache
    CHECK_FALSE(session.ReloadHistory());
    CHECK(session.History().size() == 1);
}

TEST_CASE("Session reload without a store fails", "[session][history]") {
    session::Session session{};
    CHECK_FALSE(session.ReloadHistory());
    CHECK(session.History().empty());
}

TEST_CASE("Session history revision tracks changes to the cached history", "[session][history]") {
    test_util::TempDir dir{};
    history::HistoryStore store{};
    REQUIRE(store.Open(dir.path / "history.db"));

    session::Session session{MakeConfig()};
    const uint64 initial = session.HistoryRevision();

    auto now = kT0;
    session.Timer().Start(now);
    session.Update(now + 10s);
    CHECK(session.HistoryRevision() == initial);

    now += 60s;
    REQUIRE(session.Update(now).recordedFocus);
    const uint64 afterFocus = session.HistoryRevision();
    CHECK(afterFocus != initial);

    // Completing a break adds nothing
    CompletePhase(session, now);
    CHECK(session.HistoryRevision() == afterFocus);

    // A failed reload keeps the cache and its revision
    CHECK_FALSE(session.ReloadHistory());
    CHECK(session.HistoryRevision() == afterFocus);

    session.AttachHistory(&store);
    REQUIRE(session.ReloadHistory());
    CHECK(session.HistoryRevision() != afterFocus);
    CHECK(session.History().empty());
}

TEST_CASE("Session snapshots capture and restore the timer", "[session]") {
    session::Session session{MakeConfig()};
    session.SetTask("snapshot");

    auto now = kT0;
    REQUIRE(CompletePhase(session, now).recordedFocus);
    session.Timer().SetPhase(timer::Phase::Focus);
    session.Timer().Start(now);
    session.Update(now + 15s);

    const auto snapshot = session.Capture();
    CHECK(snapshot.task == "snapshot");
    CHECK(snapshot.phase == timer::Phase::Focus);
    CHECK(snapshot.state == timer::TimerState::Running);
    CHECK(snapshot.remainingSeconds == 45);
    CHECK(snapshot.phaseTotalSeconds == 60);
    CHECK(snapshot.completedPomodoros == 1);

    session::Session restored{MakeConfig()};
    restored.Restore(snapshot);
    CHECK(restored.Task() == "snapshot");
    CHECK(restored.Timer().GetPhase() == timer::Phase::Focus);
    CHECK(restored.Timer().GetState() == timer::TimerState::Paused);
    CHECK(restored.Timer().RemainingSeconds() == 45);
    CHECK(restored.Timer().PhaseTotalSeconds() == 60);
    CHECK(restored.Timer().CompletedPomodoros() == 1);

    // Resuming continues from the restored countdown
    restored.Timer().TogglePause(now);
    restored.Update(now + 45s);
    CHECK(restored.Timer().GetPhase() == timer::Phase::LongBreak);
    REQUIRE(restored.History().size() == 1);
    CHECK(restored.History()[0].task == "snapshot");
}

} // namespace session_tests
