#include "fitscore/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fitscore::core {

std::int64_t SystemClock::now_unix_micros() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const std::int64_t micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();

  // Wall clocks can step backwards; never hand out a value <= the previous one.
  std::int64_t prev = last_.load(std::memory_order_relaxed);
  std::int64_t next = micros > prev ? micros : prev + 1;
  while (!last_.compare_exchange_weak(prev, next, std::memory_order_relaxed)) {
    next = micros > prev ? micros : prev + 1;
  }
  return next;
}

std::string to_iso8601(const std::int64_t unix_micros) {
  const auto time_t_value = static_cast<std::time_t>(unix_micros / 1000000);
  std::tm tm_utc{};
  gmtime_r(&time_t_value, &tm_utc);

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace fitscore::core
