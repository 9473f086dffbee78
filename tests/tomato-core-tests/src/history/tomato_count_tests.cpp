#include <catch2/catch_test_macros.hpp>

#include <tomato/history/tomato_count.hpp>

#include <vector>

using namespace tomato;

namespace tomato_count {

history::FocusRecord MakeRecord(sint64 id, std::string task, std::string completedAt, uint32 pomodoros) {
    return {
        .id = id,
        .task = std::move(task),
        .durationSeconds = 60,
        .completedAt = std::move(completedAt),
        .completedPomodoros = pomodoros,
    };
}

TEST_CASE("Tomato counts accumulate in completion order and display newest first", "[history][tomato-count]") {
    // Store order: newest first
    const std::vector<history::FocusRecord> records{
        MakeRecord(3, "A", "2026-10-19T12:00:00+08:00", 1),
        MakeRecord(2, "A", "2026-10-19T11:00:00+08:00", 1),
        MakeRecord(1, "A", "2026-10-19T10:00:00+08:00", 1),
    };

    const auto entries = history::ComputeTomatoCounts(records);
    REQUIRE(entries.size() == 3);

    CHECK(entries[0].record.id == 3);
    CHECK(entries[0].cumulativeTomatoes == 3);
    CHECK(entries[1].record.id == 2);
    CHECK(entries[1].cumulativeTomatoes == 2);
    CHECK(entries[2].record.id == 1);
    CHECK(entries[2].cumulativeTomatoes == 1);
}

TEST_CASE("Tomato counts do not depend on input order", "[history][tomato-count]") {
    const std::vector<history::FocusRecord> records{
        MakeRecord(2, "A", "2026-10-19T11:00:00+08:00", 1),
        MakeRecord(3, "A", "2026-10-19T12:00:00+08:00", 1),
        MakeRecord(1, "A", "2026-10-19T10:00:00+08:00", 1),
    };

    const auto entries = history::ComputeTomatoCounts(records);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].record.completedAt == "2026-10-19T12:00:00+08:00");
    CHECK(entries[0].cumulativeTomatoes == 3);
    CHECK(entries[2].record.completedAt == "2026-10-19T10:00:00+08:00");
    CHECK(entries[2].cumulativeTomatoes == 1);
}

TEST_CASE("Tomato counts treat zero pomodoros as one", "[history][tomato-count]") {
    const std::vector<history::FocusRecord> zero{
        MakeRecord(1, "A", "2026-10-19T10:00:00+08:00", 0),
        MakeRecord(2, "A", "2026-10-19T11:00:00+08:00", 0),
    };
    const std::vector<history::FocusRecord> one{
        MakeRecord(1, "A", "2026-10-19T10:00:00+08:00", 1),
        MakeRecord(2, "A", "2026-10-19T11:00:00+08:00", 1),
    };

    const auto zeroEntries = history::ComputeTomatoCounts(zero);
    const auto oneEntries = history::ComputeTomatoCounts(one);
    REQUIRE(zeroEntries.size() == oneEntries.size());
    for (size_t i = 0; i < zeroEntries.size(); i++) {
        CHECK(zeroEntries[i].cumulativeTomatoes == oneEntries[i].cumulativeTomatoes);
    }
    CHECK(zeroEntries[0].cumulativeTomatoes == 2);
}

TEST_CASE("Tomato counts add each record's pomodoro value", "[history][tomato-count]") {
    const std::vector<history::FocusRecord> records{
        MakeRecord(1, "A", "2026-10-19T10:00:00+08:00", 1),
        MakeRecord(2, "A", "2026-10-19T11:00:00+08:00", 2),
        MakeRecord(3, "A", "2026-10-19T12:00:00+08:00", 3),
    };

    const auto entries = history::ComputeTomatoCounts(records);
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].cumulativeTomatoes == 6);
    CHECK(entries[1].cumulativeTomatoes == 3);
    CHECK(entries[2].cumulativeTomatoes == 1);
}

TEST_CASE("Tomato counts are kept per task", "[history][tomato-count]") {
    const std::vector<history::FocusRecord> records{
        MakeRecord(1, "A", "2026-10-19T10:00:00+08:00", 1),
        MakeRecord(2, "a", "2026-10-19T10:30:00+08:00", 1),
        MakeRecord(3, "", "2026-10-19T11:00:00+08:00", 1),
        MakeRecord(4, "A", "2026-10-19T11:30:00+08:00", 1),
        MakeRecord(5, "", "2026-10-19T12:00:00+08:00", 1),
    };

    const auto entries = history::ComputeTomatoCounts(records);
    REQUIRE(entries.size() == 5);

    // Newest first: 5 (""), 4 ("A"), 3 (""), 2 ("a"), 1 ("A")
    CHECK(entries[0].record.id == 5);
    CHECK(entries[0].cumulativeTomatoes == 2);
    CHECK(entries[1].record.id == 4);
    CHECK(entries[1].cumulativeTomatoes == 2);
    CHECK(entries[2].record.id == 3);
    CHECK(entries[2].cumulativeTomatoes == 1);
    CHECK(entries[3].record.id == 2);
    CHECK(entries[3].cumulativeTomatoes == 1);
    CHECK(entries[4].record.id == 1);
    CHECK(entries[4].cumulativeTomatoes == 1);
}

TEST_CASE("Tomato counts break timestamp ties by id", "[history][tomato-count]") {
    const std::vector<history::FocusRecord> records{
        MakeRecord(8, "A", "2026-10-19T10:00:00+08:00", 1),
        MakeRecord(7, "A", "2026-10-19T10:00:00+08:00", 1),
    };

    const auto entries = history::ComputeTomatoCounts(records);
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].record.id == 8);
    CHECK(entries[0].cumulativeTomatoes == 2);
    CHECK(entries[1].record.id == 7);
    CHECK(entries[1].cumulativeTomatoes == 1);
}

TEST_CASE("Tomato counts of an empty history are empty", "[history][tomato-count]") {
    CHECK(history::ComputeTomatoCounts({}).empty());
}

} // namespace tomato_count
