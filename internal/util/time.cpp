#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace jobclaim::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::string ToRfc3339(TimePoint tp) {
  const auto  ms   = ToUnixMillis(tp);
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm     utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
  return out.str();
}

std::string FormatAge(uint64_t age_ms) {
  const uint64_t seconds = age_ms / 1000;
  if (seconds < 60) return std::to_string(seconds) + "s";
  if (seconds < 3600) return std::to_string(seconds / 60) + "m";
  if (seconds < 86400) return std::to_string(seconds / 3600) + "h";
  return std::to_string(seconds / 86400) + "d";
}

} // namespace jobclaim::util
