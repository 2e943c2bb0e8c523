#include "util/CppUtil.hpp"

#include <chrono>
#include <limits>

namespace util {

inline std::chrono::nanoseconds seconds_to_duration(double seconds) {
  using ns_t = std::chrono::nanoseconds;
  constexpr double kMaxSeconds = double(std::numeric_limits<ns_t::rep>::max()) / 1e9;
  if (seconds >= kMaxSeconds) return ns_t::max();
  if (seconds <= -kMaxSeconds) return ns_t::min();
  return ns_t(static_cast<ns_t::rep>(seconds * 1e9));
}

template <typename TimePoint, typename Duration>
TimePoint saturating_add(const TimePoint& t, const Duration& d) {
  auto d2 = std::chrono::duration_cast<typename TimePoint::duration>(d);
  if (d2.count() > 0 && t > TimePoint::max() - d2) {
    return TimePoint::max();
  }
  return t + d2;
}

}  // namespace util
