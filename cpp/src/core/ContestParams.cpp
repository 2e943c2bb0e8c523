#include "core/ContestParams.hpp"

#include "core/ContestError.hpp"
#include "util/CppUtil.hpp"

#include <cmath>

namespace core {

void ContestParams::validate() const {
  if (!(time_budget_per_move > 0)) {
    throw ContestError(ErrorKind::kConfigurationError,
                       "time_budget_per_move must be positive (got {})", time_budget_per_move);
  }
  if (!(timeout_tolerance >= 0) || std::isinf(timeout_tolerance)) {
    throw ContestError(ErrorKind::kConfigurationError,
                       "timeout_tolerance must be finite and non-negative (got {})",
                       timeout_tolerance);
  }
  if (!forfeit_on_violation.has_value()) {
    throw ContestError(ErrorKind::kConfigurationError,
                       "forfeit_on_violation must be set explicitly");
  }
}

duration_t ContestParams::time_budget() const {
  return util::seconds_to_duration(time_budget_per_move);
}

duration_t ContestParams::tolerance() const { return util::seconds_to_duration(timeout_tolerance); }

}  // namespace core
