#include "search/MinimaxParams.hpp"

#include "core/ContestError.hpp"

namespace search {

void MinimaxParams::validate() const {
  if (max_search_depth < 1) {
    throw core::ContestError(core::ErrorKind::kConfigurationError,
                             "max_search_depth must be at least 1 (got {})", max_search_depth);
  }
  if (tie_break_policy != kFirstEncountered && tie_break_policy != kRandom) {
    throw core::ContestError(core::ErrorKind::kConfigurationError, "unknown tie-break policy {}",
                             int(tie_break_policy));
  }
}

}  // namespace search
