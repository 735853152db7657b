#pragma once

#include <chrono>
#include <string>

namespace intake_core {

using TimePoint = std::chrono::system_clock::time_point;

// ISO-8601 in UTC with microseconds, e.g. 2024-05-01T12:30:00.123456Z
std::string time_point_to_string(const TimePoint& tp);
TimePoint string_to_time_point(const std::string& time_str);

// Compact stamp used in session identifiers: YYYYMMDD_HHMMSS (UTC)
std::string compact_timestamp(const TimePoint& tp);

}  // namespace intake_core
