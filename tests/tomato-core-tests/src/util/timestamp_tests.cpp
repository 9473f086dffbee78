#include <catch2/catch_test_macros.hpp>

#include <tomato/util/timestamp.hpp>

using namespace std::chrono_literals;

namespace timestamp {

using std::chrono::system_clock;

TEST_CASE("Timestamps use a fixed UTC+8 offset", "[util][timestamp]") {
    CHECK(tomato::util::FormatTimestamp(system_clock::time_point{}) == "1970-01-01T08:00:00+08:00");
    CHECK(tomato::util::FormatTimestamp(system_clock::time_point{1'700'000'000s}) == "2023-11-15T06:13:20+08:00");
}

TEST_CASE("Timestamps roll over to the next local day", "[util][timestamp]") {
    CHECK(tomato::util::FormatTimestamp(system_clock::time_point{16h - 1s}) == "1970-01-01T23:59:59+08:00");
    CHECK(tomato::util::FormatTimestamp(system_clock::time_point{16h}) == "1970-01-02T00:00:00+08:00");
}

TEST_CASE("Timestamps truncate sub-second precision", "[util][timestamp]") {
    const system_clock::time_point base{1'700'000'000s};
    CHECK(tomato::util::FormatTimestamp(base + 999ms) == tomato::util::FormatTimestamp(base));
}

TEST_CASE("Timestamps sort in chronological order", "[util][timestamp]") {
    const system_clock::time_point base{1'700'000'000s};
    const auto earlier = tomato::util::FormatTimestamp(base + 9s);
    const auto later = tomato::util::FormatTimestamp(base + 10s);
    CHECK(earlier < later);
}

} // namespace timestamp
