#include "time.hpp"

#include <ctime>

namespace imc::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToRFC3339(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

std::string NowRFC3339() {
  return ToRFC3339(Now());
}

} // namespace imc::util
