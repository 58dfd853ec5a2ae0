#include "ragdesk_core/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ragdesk_core::time {

std::string to_iso8601_utc(std::chrono::system_clock::time_point tp) {
  const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
  if (micros < 0) {
    micros = 0;
  }

  const std::time_t time_value = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm_buffer{};
  gmtime_r(&time_value, &tm_buffer);

  std::ostringstream oss;
  oss << std::put_time(&tm_buffer, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
  return oss.str();
}

std::string current_time_iso8601() {
  return to_iso8601_utc(std::chrono::system_clock::now());
}

}  // namespace ragdesk_core::time
