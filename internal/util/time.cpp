#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace schemaflow::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatIso8601(TimePoint tp) {
  auto        sec    = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto        millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - sec).count();
  std::time_t t      = Clock::to_time_t(sec);

  std::tm utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

} // namespace schemaflow::util
