#include <tomato/util/timestamp.hpp>

#include <fmt/format.h>

namespace tomato::util {

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;

    const auto local = floor<seconds>(time) + kTimestampUTCOffset;
    const auto day = floor<days>(local);
    const year_month_day ymd{day};
    const hh_mm_ss hms{local - day};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}+{:02}:00", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), hms.hours().count(),
                       hms.minutes().count(), hms.seconds().count(), kTimestampUTCOffset.count());
}

} // namespace tomato::util
