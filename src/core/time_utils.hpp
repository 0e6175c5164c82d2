#ifndef TOPOCRAWL_CORE_TIME_UTILS_HPP_
#define TOPOCRAWL_CORE_TIME_UTILS_HPP_

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace topocrawl::core {

// Canonical UTC timestamp used by log records, device timestamps and result
// metadata. Millisecond precision.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::string NowUtcTimestamp() {
  return FormatUtcTimestamp(std::chrono::system_clock::now());
}

// Log correlation id for one crawl, e.g. "crawl-1760781234567".
inline std::string MakeRunId() {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return "crawl-" + std::to_string(millis);
}

// Cooperative time budget. Blocking steps clamp their own timeouts to what is
// left so a whole multi-step workflow cannot outlive the budget.
class Deadline {
public:
  explicit Deadline(std::chrono::milliseconds budget)
      : expires_at_(std::chrono::steady_clock::now() + budget) {}

  bool Expired() const {
    return std::chrono::steady_clock::now() >= expires_at_;
  }

  std::chrono::milliseconds Remaining() const {
    // Rounded up so a step clamped to the remainder never ends before the budget.
    const auto left = std::chrono::ceil<std::chrono::milliseconds>(
        expires_at_ - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(0));
  }

  std::chrono::milliseconds Clamp(std::chrono::milliseconds requested) const {
    return std::min(requested, Remaining());
  }

private:
  std::chrono::steady_clock::time_point expires_at_;
};

} // namespace topocrawl::core

#endif // TOPOCRAWL_CORE_TIME_UTILS_HPP_
