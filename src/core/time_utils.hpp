#ifndef ROWGUARD_CORE_TIME_UTILS_HPP_
#define ROWGUARD_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace rowguard::core {

// UTC timestamp with millisecond precision, shared by log lines and the
// summary artifact.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Measures wall time of one run on the steady clock.
class Stopwatch {
public:
  Stopwatch() : started_at_(std::chrono::system_clock::now()), start_(Clock::now()) {}

  std::chrono::system_clock::time_point StartedAt() const {
    return started_at_;
  }

  std::int64_t ElapsedMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
  }

private:
  using Clock = std::chrono::steady_clock;

  std::chrono::system_clock::time_point started_at_;
  Clock::time_point start_;
};

} // namespace rowguard::core

#endif // ROWGUARD_CORE_TIME_UTILS_HPP_
