#pragma once

#include <chrono>
#include <string>

namespace ragdesk_core::time {

// Formats a UTC time as ISO-8601 with microsecond precision and a trailing 'Z'.
std::string to_iso8601_utc(std::chrono::system_clock::time_point tp);
std::string current_time_iso8601();

}  // namespace ragdesk_core::time
