#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace ferry::util {

int64_t ElapsedMillis(SteadyClock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
}

std::string FormatMicros(int64_t micros_since_epoch) {
  int64_t seconds = micros_since_epoch / 1000000;
  int64_t micros  = micros_since_epoch % 1000000;
  if (micros < 0) {
    micros += 1000000;
    seconds -= 1;
  }

  const std::time_t t = static_cast<std::time_t>(seconds);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%06lld", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(micros));
  return buf;
}

} // namespace ferry::util
