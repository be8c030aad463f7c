#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace pool_visualizer {

// Wall-clock instant with second resolution. Snapshot files carry no offset,
// so DateTime and DateTimeUTC are both stored as naive civil times.
using Timestamp = std::chrono::sys_seconds;

// Strict YYYY-MM-DDTHH:MM:SS. Anything else, including trailing text or an
// impossible calendar date, yields nullopt.
std::optional<Timestamp> ParseTimestamp(std::string_view text);

std::string FormatTimestamp(Timestamp ts, char dateTimeSeparator = 'T');

}  // namespace pool_visualizer
