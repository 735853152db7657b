#include "intake_core/utils/time_utils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace intake_core {

std::string time_point_to_string(const TimePoint& tp) {
  const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
  std::time_t time_t = std::chrono::system_clock::to_time_t(secs);
  if (micros < 0) {
    micros += 1000000;
    time_t -= 1;
  }
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
     << std::setfill('0') << micros << 'Z';
  return ss.str();
}

TimePoint string_to_time_point(const std::string& time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    throw std::runtime_error("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DDTHH:MM:SS.ffffffZ.");
  }
  long long micros = 0;
  if (ss.peek() == '.') {
    ss.get();
    std::string fraction;
    while (std::isdigit(ss.peek())) {
      fraction.push_back(static_cast<char>(ss.get()));
    }
    fraction.resize(6, '0');
    micros = std::stoll(fraction);
  }
  // Stored in UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct)) +
         std::chrono::microseconds(micros);
}

std::string compact_timestamp(const TimePoint& tp) {
  std::time_t time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y%m%d_%H%M%S");
  return ss.str();
}

}  // namespace intake_core
