#pragma once

#include <chrono>
#include <string>

namespace tomato::util {

// Offset applied to every stored timestamp (UTC+8).
inline constexpr std::chrono::hours kTimestampUTCOffset{8};

// Formats a point in time as ISO-8601 with a fixed +08:00 offset, e.g. "2026-10-19T14:03:05+08:00".
// Sub-second precision is truncated. Strings sort lexicographically in chronological order.
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

} // namespace tomato::util
